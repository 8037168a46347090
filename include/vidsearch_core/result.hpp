#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace vidsearch_core {

enum class ErrorKind {
  InputNotFound,
  DecodeFailure,
  NoScenesDetected,
  EncoderUnavailable,
  StoreWriteFailure,
  StoreQueryFailure,
  EmptyInput,
  Cancelled
};

std::string to_string(ErrorKind kind);

struct Failure {
  ErrorKind kind;
  std::string message;
  // Record id, frame number or path the failure refers to (may be empty)
  std::string context;

  std::string describe() const;
};

/*
Value-or-failure returned across the collaborator boundaries (store, encoder, decoder).
Reading the wrong side is a programming error and throws std::logic_error.
*/
template <typename T>
class Result {
 public:
  static Result success(T value) {
    Result result;
    result.value_ = std::move(value);
    return result;
  }

  static Result failure(Failure failure) {
    Result result;
    result.failure_ = std::move(failure);
    return result;
  }

  static Result failure(ErrorKind kind, std::string message, std::string context = "") {
    return failure(Failure{kind, std::move(message), std::move(context)});
  }

  bool ok() const {
    return value_.has_value();
  }
  explicit operator bool() const {
    return ok();
  }

  const T &value() const {
    if (!value_) {
      throw std::logic_error("Result has no value: " + failure_->describe());
    }
    return *value_;
  }

  T &value() {
    if (!value_) {
      throw std::logic_error("Result has no value: " + failure_->describe());
    }
    return *value_;
  }

  const Failure &error() const {
    if (!failure_) {
      throw std::logic_error("Result holds a value, not a failure");
    }
    return *failure_;
  }

 private:
  Result() = default;

  std::optional<T> value_;
  std::optional<Failure> failure_;
};

}  // namespace vidsearch_core
