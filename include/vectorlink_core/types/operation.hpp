#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vectorlink_core {

enum class OperationType {
  Inserted,
  Changed,
  Deleted,
  Error
};

// One record of the operation log. Only inserts and changes carry text.
struct Operation {
  OperationType type;
  std::string id;
  std::string string;
  std::string message;

  std::optional<std::string> text() const {
    if (type == OperationType::Inserted || type == OperationType::Changed) {
      return string;
    }
    return std::nullopt;
  }

  // Throws std::invalid_argument when the record does not describe an operation.
  static Operation from_json(const nlohmann::json &record);
};

}  // namespace vectorlink_core
