#include "vectorlink_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vectorlink_core {

HeuristicTokenizer::HeuristicTokenizer(size_t max_item_tokens)
    : max_item_tokens_(max_item_tokens) {
  if (max_item_tokens_ == 0) {
    throw std::invalid_argument("HeuristicTokenizer needs a positive max_item_tokens.");
  }
}

size_t HeuristicTokenizer::count_tokens(const std::string &text) const {
  if (text.empty()) {
    return 0;
  }
  // Items reach us already validated by the source, so distance() won't throw on them.
  const auto code_points = static_cast<size_t>(utf8::distance(text.begin(), text.end()));
  const auto estimate =
      static_cast<size_t>(std::ceil(static_cast<float>(code_points) / CHAR_PER_TOKEN_ESTIMATE));
  return std::min(estimate, max_item_tokens_);
}

}  // namespace vectorlink_core
