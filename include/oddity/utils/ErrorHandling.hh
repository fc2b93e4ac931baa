#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace oddity {

// Thrown for programming errors and unusable setup (unknown animation clip,
// degenerate platform geometry). Recoverable failures use Result instead.
class OddityException : public std::exception {
public:
  explicit OddityException(std::string message);
  const char *what() const noexcept override;

private:
  std::string message_;
};

// Logs at error level, then throws OddityException.
[[noreturn]] void throwError(const std::string &message);

enum class ErrorCode : uint8_t {
  Ok = 0,
  NotFound,        // missing file or key
  ParseError,      // TOML syntax error
  TypeMismatch,    // key present with another type
  OutOfRange,      // value rejected by validation
  MalformedState,  // serialized entity state missing common fields
  InvalidArgument  // bad command line
};

std::string_view errorCodeToString(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::Ok;
  std::string message;
};

/**
 * @brief Value or Error, for config loading and state parsing
 *
 * Move-only. value() on an error throws OddityException with the error's
 * description, so callers that already checked isOk() can use it directly.
 */
template <typename T>
class Result {
public:
  static Result ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(std::in_place_index<1>, Error{code, std::move(message)});
  }

  bool isOk() const { return held_.index() == 0; }
  bool isError() const { return !isOk(); }

  ErrorCode code() const {
    return isOk() ? ErrorCode::Ok : std::get<1>(held_).code;
  }

  const std::string &message() const {
    static const std::string none;
    return isOk() ? none : std::get<1>(held_).message;
  }

  T &value() {
    requireValue();
    return std::get<0>(held_);
  }

  const T &value() const {
    requireValue();
    return std::get<0>(held_);
  }

  T valueOr(T fallback) const {
    return isOk() ? std::get<0>(held_) : std::move(fallback);
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  template <std::size_t I, typename Arg>
  Result(std::in_place_index_t<I> tag, Arg &&arg)
      : held_(tag, std::forward<Arg>(arg)) {}

  void requireValue() const {
    if (isError()) {
      const Error &err = std::get<1>(held_);
      throwError(std::string(errorCodeToString(err.code)) + ": " +
                 err.message);
    }
  }

  std::variant<T, Error> held_;
};

template <>
class Result<void> {
public:
  static Result ok() { return Result(std::nullopt); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(Error{code, std::move(message)});
  }

  bool isOk() const { return !error_; }
  bool isError() const { return error_.has_value(); }
  ErrorCode code() const { return error_ ? error_->code : ErrorCode::Ok; }

  const std::string &message() const {
    static const std::string none;
    return error_ ? error_->message : none;
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  explicit Result(std::optional<Error> error) : error_(std::move(error)) {}

  std::optional<Error> error_;
};

} // namespace oddity
