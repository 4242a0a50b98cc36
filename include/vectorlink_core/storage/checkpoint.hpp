#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "vectorlink_core/storage/file_handle.hpp"

namespace vectorlink_core {

/**
 * @class Checkpoint
 * @brief Durable count of embeddings already stored, used to resume a run.
 *
 * The file holds exactly 8 bytes: the cursor as a big-endian uint64. A file
 * of any other length (including a freshly created one) means "nothing done
 * yet"; it is reset to 0 on open rather than reported as an error.
 *
 * advance() must only be called once the matching vectors are durable. The
 * in-memory cursor changes only after the new value has been synced.
 */
class Checkpoint {
 public:
  explicit Checkpoint(const std::filesystem::path &progress_path);

  // Disable copy constructor and assignment
  Checkpoint(const Checkpoint &) = delete;
  Checkpoint &operator=(const Checkpoint &) = delete;

  Checkpoint(Checkpoint &&) noexcept = default;
  Checkpoint &operator=(Checkpoint &&) noexcept = default;

  uint64_t cursor() const {
    return cursor_;
  }

  // True when the file was missing or malformed and had to be reset.
  bool was_reset() const {
    return was_reset_;
  }

  void advance(uint64_t count);

  // Reads a checkpoint without creating or repairing it. std::nullopt when
  // the file is absent or not exactly 8 bytes.
  static std::optional<uint64_t> peek(const std::filesystem::path &progress_path);

  static constexpr size_t COUNTER_WIDTH = 8;

 private:
  void store(uint64_t value);

  FileHandle file_;
  uint64_t cursor_ = 0;
  bool was_reset_ = false;
};

}  // namespace vectorlink_core
