#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace vectorlink_core {

// Pull-based stage producing text items in log order. std::nullopt means exhausted.
class TextItemStream {
 public:
  virtual ~TextItemStream() = default;

  virtual std::optional<std::string> next() = 0;
};

// Drops the first `count` items of the upstream stage, lazily on first pull.
class SkipItems : public TextItemStream {
 public:
  SkipItems(TextItemStream &upstream, uint64_t count);

  std::optional<std::string> next() override;

  // Items actually discarded so far; smaller than count when upstream ran dry.
  uint64_t skipped() const {
    return skipped_;
  }

 private:
  TextItemStream &upstream_;
  uint64_t count_;
  uint64_t skipped_ = 0;
  bool exhausted_ = false;
};

}  // namespace vectorlink_core
