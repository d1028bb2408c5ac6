#pragma once

#include <string>
#include <vector>

#include "ragline_core/llm/language_model.hpp"

namespace ragline_core {

// Offline provider: zero embeddings and a fixed reply
class StubLanguageModel : public LanguageModel {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 384;
  static constexpr const char *STUB_RESPONSE =
      "This is a stub response. Configure a real LLM provider for actual answers.";

  explicit StubLanguageModel(size_t dimension = DEFAULT_DIMENSION) : dimension_(dimension) {}

  std::vector<float> embed(const std::string &text) override;
  std::string generate(const std::string &prompt, const std::string &context) override;
  bool is_available() override {
    return true;
  }

 private:
  size_t dimension_;
};

}  // namespace ragline_core
