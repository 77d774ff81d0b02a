#include "record_parser.hpp"

#include <charconv>
#include <string>
#include <vector>

#include "internal/util/entity_id.hpp"
#include "internal/util/errors.hpp"

namespace txcluster::ingest {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
  while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> SplitFields(std::string_view line) {
  std::vector<std::string_view> fields;

  if (line.find(',') != std::string_view::npos) {
    size_t start = 0;
    for (;;) {
      size_t comma = line.find(',', start);
      fields.push_back(Trim(line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start)));
      if (comma == std::string_view::npos) break;
      start = comma + 1;
    }
    return fields;
  }

  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && IsSpace(line[i])) ++i;
    size_t start = i;
    while (i < line.size() && !IsSpace(line[i])) ++i;
    if (i > start) fields.push_back(line.substr(start, i - start));
  }
  return fields;
}

template <typename T>
bool ParseInteger(std::string_view s, T& out) {
  if (s.empty() || s.front() == '+') return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

std::string EntityOrThrow(util::Side side, std::string_view raw, uint64_t line_number) {
  auto id = util::MakeEntityId(side, raw);
  if (!id) {
    throw util::MalformedRecordError(line_number, std::string("invalid ") + util::SideName(side) + " id '" + std::string(raw) + "'");
  }
  return *id;
}

} // namespace

bool IsBlankOrComment(std::string_view line) {
  auto trimmed = Trim(line);
  return trimmed.empty() || trimmed.front() == '#';
}

std::optional<InteractionRecord> ParseRecordLine(std::string_view line, uint64_t line_number, bool allow_header) {
  if (IsBlankOrComment(line)) {
    return std::nullopt;
  }

  auto fields = SplitFields(Trim(line));
  if (allow_header && fields.front() == "cardholder_id") {
    return std::nullopt;
  }

  if (fields.size() < 2 || fields.size() > 4) {
    throw util::MalformedRecordError(line_number, "expected 2 to 4 fields, got " + std::to_string(fields.size()));
  }

  InteractionRecord record;
  record.cardholder_id = EntityOrThrow(util::Side::kCardholder, fields[0], line_number);
  record.merchant_id   = EntityOrThrow(util::Side::kMerchant, fields[1], line_number);

  if (fields.size() >= 3) {
    uint64_t weight = 0;
    if (!ParseInteger(fields[2], weight) || weight < 1 || weight > kMaxRecordWeight) {
      throw util::MalformedRecordError(line_number, "weight must be an integer in [1, " + std::to_string(kMaxRecordWeight) + "], got '" +
                                                        std::string(fields[2]) + "'");
    }
    record.weight = weight;
  }

  if (fields.size() == 4) {
    int64_t ts = 0;
    if (!ParseInteger(fields[3], ts)) {
      throw util::MalformedRecordError(line_number, "timestamp must be an integer, got '" + std::string(fields[3]) + "'");
    }
    record.timestamp = ts;
  }

  return record;
}

} // namespace txcluster::ingest
