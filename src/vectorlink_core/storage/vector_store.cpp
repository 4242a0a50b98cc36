#include "vectorlink_core/storage/vector_store.hpp"

#include <limits>
#include <stdexcept>
#include <system_error>

#include "vectorlink_core/errors.hpp"

namespace vectorlink_core {

VectorStore::VectorStore(const std::filesystem::path &vector_path, size_t dimension)
    : dimension_(dimension), file_(vector_path) {
  if (dimension_ == 0) {
    throw std::invalid_argument("VectorStore dimension must be greater than 0.");
  }
}

void VectorStore::validate_vector_dimension(const Embedding &vector) const {
  if (vector.size() != dimension_) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Vector dimension mismatch. Expected " + std::to_string(dimension_) +
                             ", got " + std::to_string(vector.size()));
  }
}

uint64_t VectorStore::byte_offset(uint64_t index) const {
  if (index > std::numeric_limits<uint64_t>::max() / record_size()) {
    throw IoError("record index " + std::to_string(index) + " overflows the file offset of '" +
                  path().string() + "'");
  }
  return index * record_size();
}

void VectorStore::write(uint64_t start_index, const std::vector<Embedding> &embeddings) {
  if (embeddings.empty()) {
    return;
  }
  for (const auto &embedding : embeddings) {
    validate_vector_dimension(embedding);
  }

  // Encode the whole batch up front so a single positioned write covers it.
  std::vector<uint8_t> buffer(embeddings.size() * record_size());
  uint8_t *out = buffer.data();
  for (const auto &embedding : embeddings) {
    for (float component : embedding) {
      encode_float_le(component, out);
      out += FLOAT_WIDTH;
    }
  }

  file_.write_at(buffer.data(), buffer.size(), byte_offset(start_index));
  file_.sync();
}

std::vector<Embedding> VectorStore::read(uint64_t start_index, size_t count) const {
  std::vector<Embedding> embeddings;
  if (count == 0) {
    return embeddings;
  }

  std::vector<uint8_t> buffer(count * record_size());
  file_.read_at(buffer.data(), buffer.size(), byte_offset(start_index));

  embeddings.reserve(count);
  const uint8_t *in = buffer.data();
  for (size_t i = 0; i < count; ++i) {
    Embedding embedding(dimension_);
    for (size_t d = 0; d < dimension_; ++d) {
      embedding[d] = decode_float_le(in);
      in += FLOAT_WIDTH;
    }
    embeddings.push_back(std::move(embedding));
  }
  return embeddings;
}

uint64_t VectorStore::record_count() const {
  return file_.size() / record_size();
}

uint64_t VectorStore::record_count(const std::filesystem::path &vector_path, size_t dimension) {
  if (dimension == 0) {
    throw std::invalid_argument("VectorStore dimension must be greater than 0.");
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(vector_path, ec);
  if (ec == std::errc::no_such_file_or_directory) {
    return 0;
  }
  if (ec) {
    throw IoError(format_io_error("stat", vector_path.string(), ec.value()));
  }
  return size / (dimension * FLOAT_WIDTH);
}

}  // namespace vectorlink_core
