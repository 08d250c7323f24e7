// result.hpp - Result type for engine operations
//
// A Result<T> holds either a success value or an Error. Engine operations
// return it instead of printing and continuing, so every failure reaches the
// caller with its kind and the path it concerns.
//
//   Result<TextDocument> doc = TextDocument::load(path);
//   if (!doc) {
//     LOG_WARN(doc.error().describe());
//     return;
//   }
//   use(doc.value());
#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace fs = std::filesystem;

namespace scaffix {

enum class ErrorKind {
  NotFound,         // expected input file or directory is absent
  BlockNotFound,    // marker or list-block opener could not be located
  ConflictDetected, // destination already holds content
  IOFailure,        // read/write/move failed
  InvalidPlan       // plan or config could not be parsed
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::BlockNotFound:
    return "BlockNotFound";
  case ErrorKind::ConflictDetected:
    return "ConflictDetected";
  case ErrorKind::IOFailure:
    return "IOFailure";
  case ErrorKind::InvalidPlan:
    return "InvalidPlan";
  }
  return "Unknown";
}

struct Error {
  ErrorKind kind = ErrorKind::IOFailure;
  std::string message;
  fs::path path;

  Error() = default;
  Error(ErrorKind k, std::string msg, fs::path p = {})
      : kind(k), message(std::move(msg)), path(std::move(p)) {}

  std::string describe() const {
    std::string out = std::string(error_kind_name(kind)) + ": " + message;
    if (!path.empty()) {
      out += " (" + path.string() + ")";
    }
    return out;
  }

  bool operator==(const Error &other) const {
    return kind == other.kind && message == other.message &&
           path == other.path;
  }
};

template <typename T, typename E = Error> class Result {
public:
  Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

  template <typename Err,
            typename = std::enable_if_t<std::is_convertible_v<Err, E> &&
                                        !std::is_convertible_v<Err, T>>>
  Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

  bool is_ok() const { return data_.index() == 0; }
  bool is_err() const { return data_.index() == 1; }
  explicit operator bool() const { return is_ok(); }

  T &value() & {
    if (is_err())
      throw std::runtime_error("Result is error: " + error().message);
    return std::get<0>(data_);
  }

  const T &value() const & {
    if (is_err())
      throw std::runtime_error("Result is error: " + error().message);
    return std::get<0>(data_);
  }

  T &&value() && {
    if (is_err())
      throw std::runtime_error("Result is error: " + error().message);
    return std::get<0>(std::move(data_));
  }

  const E &error() const & {
    if (is_ok())
      throw std::runtime_error("Result is ok, no error");
    return std::get<1>(data_);
  }

  std::optional<E> err() const & {
    if (is_err())
      return std::get<1>(data_);
    return std::nullopt;
  }

private:
  std::variant<T, E> data_;
};

template <typename E> class Result<void, E> {
public:
  Result() : data_(std::monostate{}) {}

  template <typename Err,
            typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
  Result(Err error) : data_(E(std::move(error))) {}

  bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
  bool is_err() const { return std::holds_alternative<E>(data_); }
  explicit operator bool() const { return is_ok(); }

  const E &error() const & {
    if (is_ok())
      throw std::runtime_error("Result is ok, no error");
    return std::get<E>(data_);
  }

private:
  std::variant<std::monostate, E> data_;
};

inline Result<void> Ok() { return Result<void>(); }

} // namespace scaffix
