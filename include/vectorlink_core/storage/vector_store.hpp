#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "vectorlink_core/storage/file_handle.hpp"
#include "vectorlink_core/types/chunk.hpp"

namespace vectorlink_core {

/**
 * @class VectorStore
 * @brief Flat file of fixed-width embedding records addressed by global index.
 *
 * Record i lives at byte i * record_size(). Each component is written as a
 * little-endian IEEE-754 binary32, so the file does not depend on host layout.
 */
class VectorStore {
 public:
  VectorStore(const std::filesystem::path &vector_path, size_t dimension);
  ~VectorStore() = default;

  // Disable copy constructor and assignment
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Allow move constructor and assignment
  VectorStore(VectorStore &&) noexcept = default;
  VectorStore &operator=(VectorStore &&) noexcept = default;

  // Writes the embeddings as records [start_index, start_index + size) and syncs.
  // Every embedding is checked against dimension() before anything is written.
  void write(uint64_t start_index, const std::vector<Embedding> &embeddings);

  std::vector<Embedding> read(uint64_t start_index, size_t count) const;

  // Complete records in the file; a torn tail is not counted.
  uint64_t record_count() const;

  // Same count for a file that is not open. A missing file holds 0 records and is not created.
  static uint64_t record_count(const std::filesystem::path &vector_path, size_t dimension);

  size_t dimension() const {
    return dimension_;
  }

  size_t record_size() const {
    return dimension_ * FLOAT_WIDTH;
  }

  const std::filesystem::path &path() const {
    return file_.path();
  }

  static constexpr size_t FLOAT_WIDTH = 4;

 private:
  void validate_vector_dimension(const Embedding &vector) const;
  uint64_t byte_offset(uint64_t index) const;

  size_t dimension_;
  FileHandle file_;
};

}  // namespace vectorlink_core
