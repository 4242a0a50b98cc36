#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "vectorlink_core/source/text_item_stream.hpp"
#include "vectorlink_core/types/operation.hpp"

namespace vectorlink_core {

/**
 * @class TextItemSource
 * @brief Reads a newline-delimited JSON operation log and yields the text payloads.
 *
 * The log is always read from offset zero, so two sources over the same file
 * yield the same item sequence. Resumption relies on that: it skips by item
 * count, not by line count.
 *
 * Any malformed line (bad UTF-8, bad JSON, unknown operation) throws a
 * ParseError and stops the source; later calls to next() return std::nullopt.
 */
class TextItemSource : public TextItemStream {
 public:
  explicit TextItemSource(const std::filesystem::path &log_path);

  TextItemSource(const TextItemSource &) = delete;
  TextItemSource &operator=(const TextItemSource &) = delete;

  std::optional<std::string> next() override;

  size_t lines_read() const {
    return line_number_;
  }

 private:
  std::optional<Operation> next_operation();
  Operation parse_line(const std::string &line) const;

  std::filesystem::path log_path_;
  std::ifstream log_stream_;
  size_t line_number_ = 0;
  bool stopped_ = false;
};

}  // namespace vectorlink_core
