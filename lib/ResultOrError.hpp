#ifndef BT_TRACKER_RESULT_OR_ERROR_HPP
#define BT_TRACKER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace bt {

/**
 * Common base for all error types carried by ResultOrError.
 * code is the discriminable kind, message the human readable detail.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

template <typename T, typename E> class ResultOrError {
public:
  // Success
  ResultOrError(const T &value) : storage_(std::in_place_index<0>, value) {}
  ResultOrError(T &&value) : storage_(std::in_place_index<0>, std::move(value)) {}

  // Error
  ResultOrError(const E &err) : storage_(std::in_place_index<1>, err) {}
  ResultOrError(E &&err) : storage_(std::in_place_index<1>, std::move(err)) {}

  bool isOk() const { return storage_.index() == 0; }
  bool isError() const { return storage_.index() == 1; }
  explicit operator bool() const { return isOk(); }

  const T &value() const {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               std::get<1>(storage_).message);
    }
    return std::get<0>(storage_);
  }

  T &value() {
    if (!isOk()) {
      throw std::runtime_error("Attempting to access value of error result: " +
                               std::get<1>(storage_).message);
    }
    return std::get<0>(storage_);
  }

  T valueOr(const T &defaultValue) const {
    return isOk() ? std::get<0>(storage_) : defaultValue;
  }

  const E &error() const {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  E &error() {
    if (isOk()) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return std::get<1>(storage_);
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  std::variant<T, E> storage_;
};

// Specialization for operations without a return value
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() = default;
  ResultOrError(const E &err) : hasError_(true), error_(err) {}
  ResultOrError(E &&err) : hasError_(true), error_(std::move(err)) {}

  bool isOk() const { return !hasError_; }
  bool isError() const { return hasError_; }
  explicit operator bool() const { return !hasError_; }

  const E &error() const {
    if (!hasError_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

  E &error() {
    if (!hasError_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return error_;
  }

private:
  bool hasError_{ false };
  E error_;
};

} // namespace bt

#endif // BT_TRACKER_RESULT_OR_ERROR_HPP
