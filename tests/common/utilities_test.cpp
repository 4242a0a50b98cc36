#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <unistd.h>

#include <nlohmann/json.hpp>

namespace vectorlink_tests {

std::filesystem::path TestUtilities::create_temp_directory(const std::string& prefix) {
  static std::atomic<int> counter{0};

  // Unique across processes (pid) and within one (counter)
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  auto directory = std::filesystem::temp_directory_path() / "vectorlink_tests" /
                   (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(timestamp) + "_" +
                    std::to_string(counter++));
  std::filesystem::create_directories(directory);
  return directory;
}

void TestUtilities::cleanup_temp_directory(const std::filesystem::path& directory) {
  std::error_code ec;
  // The shared parent stays: other test processes may be creating directories in it.
  std::filesystem::remove_all(directory, ec);
}

std::string TestUtilities::inserted_line(const std::string& id, const std::string& text) {
  return nlohmann::json{{"op", "Inserted"}, {"id", id}, {"string", text}}.dump();
}

std::string TestUtilities::changed_line(const std::string& id, const std::string& text) {
  return nlohmann::json{{"op", "Changed"}, {"id", id}, {"string", text}}.dump();
}

std::string TestUtilities::deleted_line(const std::string& id) {
  return nlohmann::json{{"op", "Deleted"}, {"id", id}}.dump();
}

void TestUtilities::write_lines(const std::filesystem::path& path,
                                const std::vector<std::string>& lines) {
  std::string contents;
  for (const auto& line : lines) {
    contents += line;
    contents += '\n';
  }
  write_raw(path, contents);
}

void TestUtilities::write_raw(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

std::vector<uint8_t> TestUtilities::read_bytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open test file: " + path.string());
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace vectorlink_tests
