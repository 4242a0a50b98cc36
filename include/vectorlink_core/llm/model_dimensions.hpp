#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace vectorlink_core {

// Output dimension of well-known Ollama embedding models. A ":tag" suffix is ignored.
std::optional<size_t> known_embedding_dimension(const std::string &model);

}  // namespace vectorlink_core
