#include "record_source.hpp"

#include <iostream>

#include "internal/util/errors.hpp"
#include "record_parser.hpp"

namespace txcluster::ingest {

StreamRecordSource::StreamRecordSource(std::istream& in) : in_(in) {
}

std::optional<InteractionRecord> StreamRecordSource::Next() {
  while (std::getline(in_, line_)) {
    ++line_number_;

    // a header is only recognized ahead of the first data line
    const bool allow_header = header_allowed_;
    if (!IsBlankOrComment(line_)) header_allowed_ = false;

    if (auto record = ParseRecordLine(line_, line_number_, allow_header)) {
      return record;
    }
  }

  if (in_.bad()) {
    throw util::StorageIOError("read failed after line " + std::to_string(line_number_), false);
  }
  return std::nullopt;
}

FileRecordSource::FileRecordSource(const std::string& path) : file_(path) {
  if (!file_.is_open()) {
    throw util::NotFound("cannot open input " + path);
  }
  inner_ = std::make_unique<StreamRecordSource>(file_);
}

std::optional<InteractionRecord> FileRecordSource::Next() {
  return inner_->Next();
}

std::unique_ptr<RecordSource> OpenRecordSource(const std::string& path) {
  if (path == "-") {
    return std::make_unique<StreamRecordSource>(std::cin);
  }
  return std::make_unique<FileRecordSource>(path);
}

} // namespace txcluster::ingest
