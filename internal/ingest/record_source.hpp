#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "interaction_record.hpp"

namespace txcluster::ingest {

/*
  Sequential source of interaction records.

  Next() returns the next record, std::nullopt at end of input, or throws
  util::MalformedRecordError for a bad record. A source stays usable after
  throwing; the following call continues with the next record.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual std::optional<InteractionRecord> Next() = 0;

  // Position of the last record returned or rejected (1-based lines).
  virtual uint64_t Position() const = 0;
};

// Line-oriented source over any std::istream (stdin, files, strings).
class StreamRecordSource final : public RecordSource {
 public:
  explicit StreamRecordSource(std::istream& in);

  std::optional<InteractionRecord> Next() override;

  uint64_t Position() const override {
    return line_number_;
  }

 private:
  std::istream& in_;
  std::string   line_;
  uint64_t      line_number_    = 0;
  bool          header_allowed_ = true;
};

class FileRecordSource final : public RecordSource {
 public:
  // throws util::NotFound when the file cannot be opened
  explicit FileRecordSource(const std::string& path);

  std::optional<InteractionRecord> Next() override;

  uint64_t Position() const override {
    return inner_->Position();
  }

 private:
  std::ifstream                       file_;
  std::unique_ptr<StreamRecordSource> inner_;
};

// "-" selects stdin.
std::unique_ptr<RecordSource> OpenRecordSource(const std::string& path);

} // namespace txcluster::ingest
