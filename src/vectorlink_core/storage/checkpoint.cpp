#include "vectorlink_core/storage/checkpoint.hpp"

#include <array>
#include <fstream>
#include <limits>
#include <system_error>

#include "vectorlink_core/errors.hpp"

namespace vectorlink_core {

Checkpoint::Checkpoint(const std::filesystem::path &progress_path) : file_(progress_path) {
  if (file_.size() != COUNTER_WIDTH) {
    // Assume we have to start from scratch
    was_reset_ = true;
    file_.truncate(0);
    store(0);
    cursor_ = 0;
    return;
  }

  std::array<uint8_t, COUNTER_WIDTH> bytes{};
  file_.read_at(bytes.data(), bytes.size(), 0);
  cursor_ = decode_u64_be(bytes.data());
}

void Checkpoint::advance(uint64_t count) {
  if (count > std::numeric_limits<uint64_t>::max() - cursor_) {
    throw IoError("checkpoint cursor overflow in '" + file_.path().string() + "'");
  }
  const uint64_t advanced = cursor_ + count;
  store(advanced);
  cursor_ = advanced;
}

void Checkpoint::store(uint64_t value) {
  std::array<uint8_t, COUNTER_WIDTH> bytes{};
  encode_u64_be(value, bytes.data());
  file_.write_at(bytes.data(), bytes.size(), 0);
  file_.sync();
}

std::optional<uint64_t> Checkpoint::peek(const std::filesystem::path &progress_path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(progress_path, ec);
  if (ec || size != COUNTER_WIDTH) {
    return std::nullopt;
  }

  std::ifstream file_stream(progress_path, std::ios::in | std::ios::binary);
  if (!file_stream.is_open()) {
    throw IoError("Could not open checkpoint: " + progress_path.string());
  }
  std::array<uint8_t, COUNTER_WIDTH> bytes{};
  if (!file_stream.read(reinterpret_cast<char *>(bytes.data()), bytes.size())) {
    throw IoError("Could not read checkpoint: " + progress_path.string());
  }
  return decode_u64_be(bytes.data());
}

}  // namespace vectorlink_core
