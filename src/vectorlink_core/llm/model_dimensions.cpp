#include "vectorlink_core/llm/model_dimensions.hpp"

#include <unordered_map>

namespace vectorlink_core {

std::optional<size_t> known_embedding_dimension(const std::string &model) {
  static const std::unordered_map<std::string, size_t> dimensions = {
      {"mxbai-embed-large", 1024},
      {"nomic-embed-text", 768},
      {"all-minilm", 384},
      {"snowflake-arctic-embed", 1024},
      {"bge-m3", 1024},
  };

  const std::string base_name = model.substr(0, model.find(':'));
  auto it = dimensions.find(base_name);
  if (it == dimensions.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace vectorlink_core
