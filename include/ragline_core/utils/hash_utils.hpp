#pragma once

#include <string>

namespace ragline_core {

class HashError : public std::exception {
 public:
  explicit HashError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lower-case hex SHA-256 of the given bytes
std::string sha256_hex(const std::string &content);

}  // namespace ragline_core
