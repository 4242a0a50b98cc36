#include "vectorlink_core/types/operation.hpp"

#include <stdexcept>

namespace vectorlink_core {

Operation Operation::from_json(const nlohmann::json &record) {
  if (!record.is_object()) {
    throw std::invalid_argument("operation record is not a JSON object");
  }
  if (!record.contains("op") || !record["op"].is_string()) {
    throw std::invalid_argument("operation record has no string 'op' tag");
  }

  const std::string tag = record["op"].get<std::string>();
  Operation op;
  if (tag == "Inserted" || tag == "Changed") {
    op.type = tag == "Inserted" ? OperationType::Inserted : OperationType::Changed;
    // at() + get<> reject missing or mistyped fields with a json exception
    op.id = record.at("id").get<std::string>();
    op.string = record.at("string").get<std::string>();
  } else if (tag == "Deleted") {
    op.type = OperationType::Deleted;
    op.id = record.at("id").get<std::string>();
  } else if (tag == "Error") {
    op.type = OperationType::Error;
    op.message = record.at("message").get<std::string>();
  } else {
    throw std::invalid_argument("unknown operation tag '" + tag + "'");
  }
  return op;
}

}  // namespace vectorlink_core
