#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "interaction_record.hpp"

namespace txcluster::ingest {

inline constexpr uint64_t kMaxRecordWeight = 0xFFFFFFFFull;

/*
  Parses one input line:

      cardholder_id merchant_id [weight] [timestamp]

  Fields are separated by whitespace, or by commas when the line contains
  any. Returns std::nullopt for blank lines, '#' comments and, when
  `allow_header` is set, a header line whose first field is
  "cardholder_id". Anything else that does not parse raises
  util::MalformedRecordError.
*/
std::optional<InteractionRecord> ParseRecordLine(std::string_view line, uint64_t line_number, bool allow_header = false);

// True for lines that carry no data: blank or '#' comment.
bool IsBlankOrComment(std::string_view line);

} // namespace txcluster::ingest
