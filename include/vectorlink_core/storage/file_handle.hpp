#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace vectorlink_core {

/**
 * @class FileHandle
 * @brief Owns a POSIX file descriptor for positioned, durable I/O.
 *
 * Every failure throws IoError naming the operation, the path and errno.
 */
class FileHandle {
 public:
  // Opens read/write, creating the file (mode 0644) if it does not exist.
  explicit FileHandle(const std::filesystem::path &path);
  ~FileHandle();

  // Disable copy constructor and assignment
  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;

  // Allow move constructor and assignment
  FileHandle(FileHandle &&other) noexcept;
  FileHandle &operator=(FileHandle &&other) noexcept;

  // Writes all `length` bytes starting at `offset`, retrying short writes.
  void write_at(const uint8_t *data, size_t length, uint64_t offset);

  // Reads exactly `length` bytes starting at `offset`; hitting end of file is an error.
  void read_at(uint8_t *data, size_t length, uint64_t offset) const;

  void truncate(uint64_t length);

  // Forces written data to stable storage (fdatasync, fsync where unavailable).
  void sync();

  uint64_t size() const;

  const std::filesystem::path &path() const {
    return path_;
  }

 private:
  void close_fd() noexcept;

  std::filesystem::path path_;
  int fd_ = -1;
};

// Fixed on-disk encodings, independent of host byte order.
void encode_float_le(float value, uint8_t *out);
float decode_float_le(const uint8_t *in);
void encode_u64_be(uint64_t value, uint8_t *out);
uint64_t decode_u64_be(const uint8_t *in);

}  // namespace vectorlink_core
