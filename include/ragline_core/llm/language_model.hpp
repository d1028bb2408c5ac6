#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace ragline_core {

class LanguageModelError : public std::exception {
 public:
  explicit LanguageModelError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class LanguageModel
 * @brief Embedding and text generation provider.
 *
 * Implementations throw LanguageModelError for any transport, timeout or
 * response-shape failure.
 */
class LanguageModel {
 public:
  virtual ~LanguageModel() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  // The context block is placed ahead of the prompt, separated by a blank line
  virtual std::string generate(const std::string &prompt, const std::string &context) = 0;

  virtual bool is_available() = 0;
};

}  // namespace ragline_core
