#include "vectorlink_core/storage/file_handle.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

#include "vectorlink_core/errors.hpp"

static_assert(std::numeric_limits<float>::is_iec559, "binary32 floats are required");
static_assert(sizeof(float) == sizeof(uint32_t), "binary32 floats are required");

namespace vectorlink_core {

FileHandle::FileHandle(const std::filesystem::path &path) : path_(path) {
  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    throw IoError(format_io_error("open", path_.string(), errno));
  }
}

FileHandle::~FileHandle() {
  close_fd();
}

FileHandle::FileHandle(FileHandle &&other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle &FileHandle::operator=(FileHandle &&other) noexcept {
  if (this != &other) {
    close_fd();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void FileHandle::close_fd() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void FileHandle::write_at(const uint8_t *data, size_t length, uint64_t offset) {
  size_t written = 0;
  while (written < length) {
    ssize_t n = ::pwrite(fd_, data + written, length - written,
                         static_cast<off_t>(offset + written));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IoError(format_io_error("write", path_.string(), errno));
    }
    written += static_cast<size_t>(n);
  }
}

void FileHandle::read_at(uint8_t *data, size_t length, uint64_t offset) const {
  size_t total = 0;
  while (total < length) {
    ssize_t n = ::pread(fd_, data + total, length - total, static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IoError(format_io_error("read", path_.string(), errno));
    }
    if (n == 0) {
      throw IoError("read failed for '" + path_.string() + "': unexpected end of file at byte " +
                    std::to_string(offset + total));
    }
    total += static_cast<size_t>(n);
  }
}

void FileHandle::truncate(uint64_t length) {
  if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
    throw IoError(format_io_error("truncate", path_.string(), errno));
  }
}

void FileHandle::sync() {
#if defined(__APPLE__)
  int rc = ::fsync(fd_);
#else
  int rc = ::fdatasync(fd_);
#endif
  if (rc != 0) {
    throw IoError(format_io_error("sync", path_.string(), errno));
  }
}

uint64_t FileHandle::size() const {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    throw IoError(format_io_error("stat", path_.string(), errno));
  }
  return static_cast<uint64_t>(st.st_size);
}

void encode_float_le(float value, uint8_t *out) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>(bits >> (8 * i));
  }
}

float decode_float_le(const uint8_t *in) {
  uint32_t bits = 0;
  for (int i = 0; i < 4; ++i) {
    bits |= static_cast<uint32_t>(in[i]) << (8 * i);
  }
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void encode_u64_be(uint64_t value, uint8_t *out) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * (7 - i)));
  }
}

uint64_t decode_u64_be(const uint8_t *in) {
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | in[i];
  }
  return value;
}

}  // namespace vectorlink_core
