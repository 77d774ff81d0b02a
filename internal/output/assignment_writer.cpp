#include "assignment_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::output {

namespace {

std::filesystem::path TmpPath(const std::filesystem::path& path) {
  auto tmp = path;
  tmp += ".tmp";
  return tmp;
}

void RenameInto(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    throw util::StorageIOError("rename " + from.string() + " -> " + to.string() + ": " + ec.message(), false);
  }
}

} // namespace

CsvAssignmentWriter::CsvAssignmentWriter(std::filesystem::path path)
    : path_(std::move(path)), tmp_path_(TmpPath(path_)), out_(tmp_path_, std::ios::out | std::ios::trunc) {
  if (!out_.is_open()) {
    throw util::StorageIOError("cannot open " + tmp_path_.string() + " for writing", false);
  }
  out_ << "entity_id,cluster_id,role,vote_weight\n";
}

CsvAssignmentWriter::~CsvAssignmentWriter() {
  if (closed_) return;
  out_.close();
  std::error_code ec;
  std::filesystem::remove(tmp_path_, ec);
  if (ec) {
    TXCLUSTER_LOG_WARN("failed to remove partial output", {observability::StringField("path", tmp_path_.string()),
                                                           observability::StringField("error", ec.message())});
  }
}

void CsvAssignmentWriter::Write(const assignment::EntityAssignment& entity) {
  for (const auto& row : entity.rows) {
    out_ << row.entity_id << ',' << row.cluster_id << ',' << db::model::RoleName(row.role) << ',' << row.weight << '\n';
    ++rows_;
  }
  if (!out_) {
    throw util::StorageIOError("write to " + tmp_path_.string() + " failed", false);
  }
}

void CsvAssignmentWriter::Close() {
  out_.flush();
  out_.close();
  if (out_.fail()) {
    throw util::StorageIOError("closing " + tmp_path_.string() + " failed", false);
  }
  RenameInto(tmp_path_, path_);
  closed_ = true;
}

void WriteReportJson(const txcluster::v1::RunReport& report, const std::filesystem::path& path) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("failed to serialize run report: " + std::string(status.message()));
  }

  auto tmp = TmpPath(path);
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    out << json;
    out.close();
    if (out.fail()) {
      throw util::StorageIOError("cannot write " + tmp.string(), false);
    }
  }
  RenameInto(tmp, path);
}

} // namespace txcluster::output
