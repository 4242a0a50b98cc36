#include "vectorlink_core/source/text_item_stream.hpp"

namespace vectorlink_core {

SkipItems::SkipItems(TextItemStream &upstream, uint64_t count)
    : upstream_(upstream), count_(count) {}

std::optional<std::string> SkipItems::next() {
  if (exhausted_) {
    return std::nullopt;
  }
  while (skipped_ < count_) {
    if (!upstream_.next()) {
      exhausted_ = true;
      return std::nullopt;
    }
    ++skipped_;
  }
  auto item = upstream_.next();
  if (!item) {
    exhausted_ = true;
  }
  return item;
}

}  // namespace vectorlink_core
