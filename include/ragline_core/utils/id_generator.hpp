#pragma once

#include <string>

namespace ragline_core {

class IdGenerationError : public std::exception {
 public:
  explicit IdGenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Random (version 4) UUID in canonical 8-4-4-4-12 lower-case form
std::string generate_uuid();

}  // namespace ragline_core
