#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "api/txcluster/v1.hpp"
#include "internal/assignment/assignment_store.hpp"

namespace txcluster::output {

// Receives the final mapping one entity at a time, in ascending id order.
class AssignmentSink {
 public:
  virtual ~AssignmentSink() = default;

  virtual void Write(const assignment::EntityAssignment& entity) = 0;
};

/*
  assignments.csv writer.

      entity_id,cluster_id,role,vote_weight

  Written to "<path>.tmp" and renamed into place by Close(), so a failed
  run never leaves a truncated file under the final name.
*/
class CsvAssignmentWriter final : public AssignmentSink {
 public:
  explicit CsvAssignmentWriter(std::filesystem::path path);
  ~CsvAssignmentWriter();

  CsvAssignmentWriter(const CsvAssignmentWriter&)            = delete;
  CsvAssignmentWriter& operator=(const CsvAssignmentWriter&) = delete;

  void Write(const assignment::EntityAssignment& entity) override;

  void Close();

  uint64_t RowsWritten() const {
    return rows_;
  }

 private:
  std::filesystem::path path_;
  std::filesystem::path tmp_path_;
  std::ofstream         out_;
  uint64_t              rows_   = 0;
  bool                  closed_ = false;
};

// report.json via protobuf's JSON printer; same tmp + rename scheme.
void WriteReportJson(const txcluster::v1::RunReport& report, const std::filesystem::path& path);

} // namespace txcluster::output
