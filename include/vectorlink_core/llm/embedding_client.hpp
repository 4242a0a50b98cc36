#pragma once

#include <string>
#include <vector>

#include "vectorlink_core/types/chunk.hpp"

namespace vectorlink_core {

/**
 * @class EmbeddingClient
 * @brief Boundary to the embedding service.
 *
 * get_embeddings() returns one embedding per input text, in input order. An
 * item that could not be embedded is counted in EmbeddingBatch::failures and
 * gets an all-zero placeholder, so positions stay aligned. A failure of the
 * whole request throws EmbeddingError classified as Service or Transport.
 *
 * The scheduler calls get_embeddings() from several threads at once.
 */
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  virtual EmbeddingBatch get_embeddings(const std::string &credential,
                                        const std::vector<std::string> &texts) = 0;

  virtual size_t dimension() const = 0;
};

}  // namespace vectorlink_core
