#include "lock_record.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace labbook::lock {

using labbook::model::Signature;

labbook::lock::v1::LockRecord ToProto(const LockRecord& record) {
  labbook::lock::v1::LockRecord proto;
  proto.set_own_signature(record.own_signature.ToHex());
  auto* deps = proto.mutable_dependency_signatures();
  for (const auto& [name, signature] : record.dependency_signatures) {
    (*deps)[name] = signature.ToHex();
  }
  return proto;
}

LockRecord FromProto(const labbook::lock::v1::LockRecord& proto) {
  LockRecord record;
  record.own_signature = Signature::FromHex(proto.own_signature());
  for (const auto& [name, hex] : proto.dependency_signatures()) {
    auto signature = Signature::FromHex(hex);
    if (signature.empty()) {
      throw std::invalid_argument("dependency '" + name + "' has an empty signature");
    }
    record.dependency_signatures.emplace(name, signature);
  }
  return record;
}

std::string SerializeLockRecord(const LockRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(record), &json, options);
  if (!status.ok()) {
    throw labbook::util::IOError("serialize lock record: " + std::string(status.message()));
  }
  return json;
}

LockRecord ParseLockRecord(const std::string& json, const std::string& source) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  labbook::lock::v1::LockRecord proto;
  auto                          status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw labbook::util::IOError("lock record " + source + " is unreadable: " + std::string(status.message()));
  }

  try {
    return FromProto(proto);
  } catch (const std::invalid_argument& e) {
    throw labbook::util::IOError("lock record " + source + " is malformed: " + e.what());
  }
}

} // namespace labbook::lock
