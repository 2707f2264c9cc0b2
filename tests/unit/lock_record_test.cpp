#include "internal/lock/lock_record.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/signature/signature_computer.hpp"
#include "internal/util/errors.hpp"

namespace {

using labbook::lock::LockRecord;
using labbook::lock::ParseLockRecord;
using labbook::lock::SerializeLockRecord;
using labbook::signature::SignatureComputer;

LockRecord MakeRecord() {
  LockRecord record;
  record.own_signature                   = SignatureComputer::Compute(std::string("own"));
  record.dependency_signatures["corpus"] = SignatureComputer::Compute(std::string("corpus"));
  record.dependency_signatures["sample"] = SignatureComputer::Compute(std::string("sample"));
  return record;
}

void TestJsonUsesCamelCaseFieldNamesAndHex() {
  const auto record = MakeRecord();
  const auto json   = SerializeLockRecord(record);

  assert(json.find("\"ownSignature\"") != std::string::npos);
  assert(json.find("\"dependencySignatures\"") != std::string::npos);
  assert(json.find(record.own_signature.ToHex()) != std::string::npos);
  assert(json.find(record.dependency_signatures.at("corpus").ToHex()) != std::string::npos);
}

void TestRoundTripPreservesRecord() {
  const auto record = MakeRecord();
  assert(ParseLockRecord(SerializeLockRecord(record), "memory") == record);
}

void TestEmptyOwnSignatureIsWrittenAndRoundTrips() {
  LockRecord record;
  record.dependency_signatures["config"] = SignatureComputer::Compute(std::string("config"));

  const auto json = SerializeLockRecord(record);
  assert(json.find("\"ownSignature\"") != std::string::npos);

  const auto parsed = ParseLockRecord(json, "memory");
  assert(parsed.own_signature.empty());
  assert(parsed == record);
}

void TestAcceptsHandWrittenJson() {
  const auto hex = SignatureComputer::Compute(std::string("corpus")).ToHex();
  const auto parsed =
      ParseLockRecord("{ \"ownSignature\": \"\", \"dependencySignatures\": { \"corpus\": \"" + hex + "\" } }", "memory");
  assert(parsed.own_signature.empty());
  assert(parsed.dependency_signatures.size() == 1);
  assert(parsed.dependency_signatures.at("corpus").ToHex() == hex);
}

void ExpectIOError(const std::string& json) {
  bool threw = false;
  try {
    (void)ParseLockRecord(json, "memory");
  } catch (const labbook::util::IOError&) {
    threw = true;
  }
  assert(threw && "malformed lock records must raise IOError");
}

void TestMalformedContentIsRejected() {
  ExpectIOError("not json");
  ExpectIOError("{ \"ownSignature\": \"abc\" }");
  ExpectIOError("{ \"ownSignature\": \"\", \"unknownField\": 1 }");
  ExpectIOError("{ \"dependencySignatures\": { \"corpus\": \"\" } }");

  // Uppercase hex is not canonical.
  std::string upper = SignatureComputer::Compute(std::string("x")).ToHex();
  for (auto& c : upper) {
    if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
  }
  ExpectIOError("{ \"ownSignature\": \"" + upper + "\" }");
}

} // namespace

int main() {
  TestJsonUsesCamelCaseFieldNamesAndHex();
  TestRoundTripPreservesRecord();
  TestEmptyOwnSignatureIsWrittenAndRoundTrips();
  TestAcceptsHandWrittenJson();
  TestMalformedContentIsRejected();

  std::cout << "labbook_unit_lock_record: pass\n";
  return 0;
}
