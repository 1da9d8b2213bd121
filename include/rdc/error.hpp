/*
 *
 *  error.hpp
 *
 *  Status and StatusOr used across the client core
 *
 */

#ifndef RDC_ERROR_HPP_
#define RDC_ERROR_HPP_

#include <iostream>
#include <string>
#include <utility>

namespace rdc {

enum class StatusCode {
  /// Not an error; returned on success.
  kOk = 0,

  kDeviceUnavailable = 1,
  kNotInitialized = 2,
  kInvalidArgument = 3,
  kQueueUnavailable = 4,
  kCreditExhausted = 5,
  kRegistrationRequired = 6,
  kRegionConflict = 7,
  kRegionInUse = 8,
  kConnectionLost = 9,
  kTransportError = 10,
  kShuttingDown = 11,
  kAlreadyFailed = 12,
  kTimeout = 13,
  kInternal = 14,
};

const char *StatusCodeName(StatusCode code);

class Status {
 public:
  Status() = default;

  explicit Status(StatusCode status_code)
      : code_(status_code), message_(StatusCodeName(status_code)) {}

  explicit Status(StatusCode status_code, std::string message)
      : code_(status_code), message_(std::move(message)) {}

  bool ok() const { return code_ == StatusCode::kOk; }
  explicit operator bool() const { return ok(); }

  StatusCode code() const { return code_; }
  std::string const& message() const { return message_; }

  // Returns the same status with msg prepended to the message
  Status Wrap(std::string const& msg) const {
    if (this->ok()) {
      return *this;
    }
    return Status(code_, msg + ": " + message_);
  }

 private:
  StatusCode code_{StatusCode::kOk};
  std::string message_;
};

inline std::ostream& operator<<(std::ostream& os, Status const& status) {
  return os << StatusCodeName(status.code()) << ": " << status.message();
}


template<typename T>
class StatusOr {
  public:
    StatusOr() : StatusOr(Status(StatusCode::kInternal, "default")) {}

    StatusOr(Status status) : status_(std::move(status)) {}

    StatusOr(T value) : value_(std::move(value)) {}

    T const& value() const& { return value_; }
    T& value() & { return value_; }
    T&& value() && { return std::move(value_); }

    bool ok() const { return status_.ok(); }
    explicit operator bool() const { return status_.ok(); }

    /**
     * @name Status accessors.
     *
     * @return All these member functions return the (properly ref and
     *     const-qualified) status. If the object contains a value then
     *     `status().ok() == true`.
     */
    Status& status() & { return status_; }
    Status const& status() const& { return status_; }
    Status&& status() && { return std::move(status_); }

  private:
    Status status_;
    T value_;
};

}
#endif // RDC_ERROR_HPP_
