#ifndef CELLFORGE_UTIL_STATUS_H_
#define CELLFORGE_UTIL_STATUS_H_

#include <string>
#include <utility>

namespace cellforge::util {

enum class StatusCode { kOk, kInvalidArgument, kNotFound, kInternal };

struct Status {
  StatusCode code = StatusCode::kOk;
  std::string message;
  static Status OK() { return Status{StatusCode::kOk, ""}; }
  static Status Invalid(const std::string& msg) {
    return Status{StatusCode::kInvalidArgument, msg};
  }
  static Status NotFound(const std::string& msg) { return Status{StatusCode::kNotFound, msg}; }
  static Status Internal(const std::string& msg) { return Status{StatusCode::kInternal, msg}; }
  bool ok() const { return code == StatusCode::kOk; }
};

template <typename T>
class StatusOr {
 public:
  StatusOr(const Status& s) : status_(s) {}
  StatusOr(T v) : status_(Status::OK()), value_(std::move(v)) {}
  const Status& status() const { return status_; }
  bool ok() const { return status_.ok(); }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_{};
};

}  // namespace cellforge::util

#endif  // CELLFORGE_UTIL_STATUS_H_
