#include "vectorlink_core/source/text_item_source.hpp"

#include <utf8.h>

#include <cerrno>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "vectorlink_core/errors.hpp"

namespace vectorlink_core {

TextItemSource::TextItemSource(const std::filesystem::path &log_path)
    : log_path_(log_path), log_stream_(log_path, std::ios::in | std::ios::binary) {
  if (!log_stream_.is_open()) {
    throw IoError(format_io_error("open operation log", log_path_.string(), errno));
  }
}

std::optional<std::string> TextItemSource::next() {
  // Operations without a payload (deletes, errors) are filtered out here.
  while (auto op = next_operation()) {
    if (auto text = op->text()) {
      return text;
    }
  }
  return std::nullopt;
}

std::optional<Operation> TextItemSource::next_operation() {
  if (stopped_) {
    return std::nullopt;
  }

  std::string line;
  if (!std::getline(log_stream_, line)) {
    stopped_ = true;
    if (log_stream_.bad()) {
      throw IoError(format_io_error("read operation log", log_path_.string(), errno));
    }
    return std::nullopt;
  }
  ++line_number_;

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  try {
    return parse_line(line);
  } catch (const ParseError &) {
    stopped_ = true;
    throw;
  }
}

Operation TextItemSource::parse_line(const std::string &line) const {
  if (!utf8::is_valid(line.begin(), line.end())) {
    throw ParseError(line_number_, "invalid UTF-8 in " + log_path_.string());
  }

  nlohmann::json record;
  try {
    record = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error &e) {
    throw ParseError(line_number_, std::string("invalid JSON: ") + e.what());
  }

  try {
    return Operation::from_json(record);
  } catch (const std::invalid_argument &e) {
    throw ParseError(line_number_, e.what());
  } catch (const nlohmann::json::exception &e) {
    throw ParseError(line_number_, std::string("malformed operation: ") + e.what());
  }
}

}  // namespace vectorlink_core
