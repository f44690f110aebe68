#pragma once

#include <optional>
#include <utility>

namespace whohas::enrich {

enum class Status {
  Success = 0,
  Unknown,
  NoRecord,
  Timeout,
  Socket
};

constexpr auto to_str(Status status) {
  switch (status) {
  case Status::Success:
    return "Success (no error)";
  case Status::NoRecord:
    return "No record found";
  case Status::Timeout:
    return "Timed out waiting for an answer";
  case Status::Socket:
    return "Socket operation failed";
  case Status::Unknown:
    return "Unknown error";
  default:
    return "Invalid status code";
  }
}

// Outcome of a best-effort network lookup: a value, or the reason it is
// missing. Failures are data, never exceptions.
template <typename T> class Result {
public:
  Result(std::optional<T> value, Status status)
      : value_(std::move(value)), status_(status) {}

  static Result success(T value) { return {std::move(value), Status::Success}; }
  static Result failure(Status status) { return {std::nullopt, status}; }

  explicit operator bool() const { return value_.has_value(); }
  const T &operator*() const { return *value_; }
  T &operator*() { return *value_; }
  const T *operator->() const { return &*value_; }
  T *operator->() { return &*value_; }

  const std::optional<T> &value() const { return value_; }

  Status status() const { return status_; }

private:
  std::optional<T> value_;
  Status status_ = Status::Unknown;
};

} // namespace whohas::enrich
