#pragma once

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace dagrun::core {

/// Rust-style Result<T, E> for explicit error handling.
/// Used for validation paths (plan construction, executor configuration)
/// where a failure is an expected outcome rather than an exceptional one.
template <typename T, typename E> class Result {
public:
  /// Construct a success result.
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }

  /// Construct an error result.
  static Result Err(E error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Access the success value. Throws std::logic_error on Err.
  [[nodiscard]] const T &value() const & {
    if (!is_ok()) {
      throw std::logic_error("Result::value() called on Err");
    }
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    if (!is_ok()) {
      throw std::logic_error("Result::value() called on Err");
    }
    return std::get<0>(std::move(storage_));
  }

  /// Access the error value. Throws std::logic_error on Ok.
  [[nodiscard]] const E &error() const & {
    if (!is_err()) {
      throw std::logic_error("Result::error() called on Ok");
    }
    return std::get<1>(storage_);
  }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V &&v) : storage_(tag, std::forward<V>(v)) {}

  std::variant<T, E> storage_;
};

/// Specialization for Result<void, E>: success carries no value.
template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

  [[nodiscard]] const E &error() const & {
    if (!error_) {
      throw std::logic_error("Result<void,E>::error() called on Ok");
    }
    return *error_;
  }

private:
  Result() = default;
  std::optional<E> error_;
};

} // namespace dagrun::core
