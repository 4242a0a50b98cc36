#pragma once

#include <cstring>
#include <exception>
#include <string>

namespace vectorlink_core {

// Common base so callers can catch every fatal pipeline error in one place.
class VectorizationError : public std::exception {
 public:
  explicit VectorizationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  virtual const char *category() const noexcept = 0;

 private:
  std::string message_;
};

enum class EmbeddingErrorKind {
  Service,
  Transport
};

inline std::string kind_to_string(EmbeddingErrorKind kind) {
  switch (kind) {
    case EmbeddingErrorKind::Service: return "service";
    case EmbeddingErrorKind::Transport: return "transport";
    default: return "unknown";
  }
}

class EmbeddingError : public VectorizationError {
 public:
  EmbeddingError(EmbeddingErrorKind kind, const std::string &message)
      : VectorizationError(message), kind_(kind) {}

  EmbeddingErrorKind kind() const noexcept {
    return kind_;
  }

  const char *category() const noexcept override {
    return kind_ == EmbeddingErrorKind::Service ? "embedding/service" : "embedding/transport";
  }

 private:
  EmbeddingErrorKind kind_;
};

class IoError : public VectorizationError {
 public:
  explicit IoError(const std::string &message) : VectorizationError(message) {}

  const char *category() const noexcept override {
    return "io";
  }
};

class ParseError : public VectorizationError {
 public:
  ParseError(size_t line_number, const std::string &message)
      : VectorizationError("line " + std::to_string(line_number) + ": " + message),
        line_number_(line_number) {}

  size_t line_number() const noexcept {
    return line_number_;
  }

  const char *category() const noexcept override {
    return "parse";
  }

 private:
  size_t line_number_;
};

// A dispatched embedding unit died with something other than a pipeline error.
class ExecutionFault : public VectorizationError {
 public:
  explicit ExecutionFault(const std::string &message) : VectorizationError(message) {}

  const char *category() const noexcept override {
    return "execution";
  }
};

inline std::string format_io_error(const std::string &operation,
                                   const std::string &path,
                                   int error_number) {
  std::string msg = operation + " failed for '" + path + "': " + std::strerror(error_number);
  msg += " [errno=" + std::to_string(error_number) + "]";
  return msg;
}

}  // namespace vectorlink_core
