#pragma once

#include <string>

namespace ragline_core {

// A referenced knowledge base, document or interaction does not exist
class NotFoundError : public std::exception {
 public:
  explicit NotFoundError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Caller-supplied input was rejected before any work was done
class ValidationError : public std::exception {
 public:
  explicit ValidationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace ragline_core
