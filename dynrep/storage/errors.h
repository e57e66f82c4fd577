#pragma once

#include <stdexcept>
#include <string>

namespace storage {

// Bad input or incompatible tables. Raised before any remote call is made.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Non-success response from the table service. Never retried.
class ServiceError : public std::runtime_error {
 public:
  ServiceError(const std::string& what, int http_status)
      : std::runtime_error(what), http_status_(http_status) {}

  int http_status() const { return http_status_; }

 private:
  int http_status_;
};

class NotFoundError : public ServiceError {
 public:
  explicit NotFoundError(const std::string& what) : ServiceError(what, 400) {}
};

// Writes the service kept leaving unprocessed until the retry ceiling was hit.
// Every call succeeded, so there is no failing HTTP status to report.
class RetryExhaustedError : public std::runtime_error {
 public:
  RetryExhaustedError(const std::string& what, int attempts)
      : std::runtime_error(what), attempts_(attempts) {}

  int attempts() const { return attempts_; }

 private:
  int attempts_;
};

}  // namespace storage
