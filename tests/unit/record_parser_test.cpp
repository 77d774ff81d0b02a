#include "internal/ingest/record_parser.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/ingest/record_source.hpp"
#include "internal/util/errors.hpp"

namespace {

using txcluster::ingest::ParseRecordLine;

bool IsMalformed(const std::string& line) {
  try {
    ParseRecordLine(line, 7);
  } catch (const txcluster::util::MalformedRecordError& e) {
    assert(e.LineNumber() == 7);
    return true;
  }
  return false;
}

void TestWhitespaceSeparatedFields() {
  auto r = ParseRecordLine("C1 M1", 1);
  assert(r.has_value());
  assert(r->cardholder_id == "C:C1");
  assert(r->merchant_id == "M:M1");
  assert(r->weight == 1);
  assert(!r->timestamp.has_value());

  r = ParseRecordLine("  C1\tM1   3  1700000000 ", 2);
  assert(r->weight == 3);
  assert(r->timestamp == 1700000000);
}

void TestCommaSeparatedFields() {
  auto r = ParseRecordLine("C1, M1,4", 1);
  assert(r->cardholder_id == "C:C1");
  assert(r->merchant_id == "M:M1");
  assert(r->weight == 4);

  r = ParseRecordLine("C1,M1,2,-5\r", 1);
  assert(r->timestamp == -5);
}

void TestIgnoredLines() {
  assert(!ParseRecordLine("", 1));
  assert(!ParseRecordLine("   \t", 1));
  assert(!ParseRecordLine("# comment", 1));
  assert(!ParseRecordLine("cardholder_id,merchant_id,weight", 1, true));
  assert(!ParseRecordLine("cardholder_id merchant_id", 1, true));

  // without the header allowance the same text is an ordinary record
  auto r = ParseRecordLine("cardholder_id merchant_id", 4);
  assert(r && r->cardholder_id == "C:cardholder_id" && r->merchant_id == "M:merchant_id");
}

void TestHeaderOnlyAheadOfFirstRecord() {
  std::istringstream in("# export\n\ncardholder_id,merchant_id,weight\nC1,M1,2\ncardholder_id,M9,3\n");
  txcluster::ingest::StreamRecordSource source(in);

  auto first = source.Next();
  assert(first && first->cardholder_id == "C:C1");
  assert(source.Position() == 4);

  auto second = source.Next();
  assert(second && second->cardholder_id == "C:cardholder_id");
  assert(second->merchant_id == "M:M9" && second->weight == 3);
  assert(!source.Next());
}

void TestMalformedRecords() {
  assert(IsMalformed("C1"));
  assert(IsMalformed("C1 M1 1 2 3"));
  assert(IsMalformed("C1 M1 0"));
  assert(IsMalformed("C1 M1 -1"));
  assert(IsMalformed("C1 M1 +2"));
  assert(IsMalformed("C1 M1 1.5"));
  assert(IsMalformed("C1 M1 abc"));
  assert(IsMalformed("C1 M1 99999999999999999999"));
  assert(IsMalformed("C1 M1 1 yesterday"));
  assert(IsMalformed("C1,,1"));
  assert(IsMalformed(std::string("C1 M\x01", 6)));
}

void TestStreamSourceContinuesAfterMalformedLine() {
  std::istringstream                    in("# header comment\nC1 M1\nbroken\n\nC2 M2 2\n");
  txcluster::ingest::StreamRecordSource source(in);

  auto first = source.Next();
  assert(first && first->cardholder_id == "C:C1");
  assert(source.Position() == 2);

  bool threw = false;
  try {
    source.Next();
  } catch (const txcluster::util::MalformedRecordError& e) {
    threw = true;
    assert(e.LineNumber() == 3);
  }
  assert(threw);

  auto second = source.Next();
  assert(second && second->merchant_id == "M:M2" && second->weight == 2);
  assert(source.Position() == 5);
  assert(!source.Next());
}

void TestMissingFileIsNotFound() {
  bool threw = false;
  try {
    txcluster::ingest::OpenRecordSource("/nonexistent/txcluster/records.txt");
  } catch (const txcluster::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWhitespaceSeparatedFields();
  TestCommaSeparatedFields();
  TestIgnoredLines();
  TestHeaderOnlyAheadOfFirstRecord();
  TestMalformedRecords();
  TestStreamSourceContinuesAfterMalformedLine();
  TestMissingFileIsNotFound();

  std::cout << "txcluster_unit_record_parser: pass\n";
  return 0;
}
