#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragline_core/llm/language_model.hpp"

namespace ollama {
class Ollama;
}

namespace ragline_core {

using OllamaError = LanguageModelError;

class OllamaClient : public LanguageModel {
 public:
  static constexpr int DEFAULT_TIMEOUT_SECONDS = 120;

  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int timeout_seconds = DEFAULT_TIMEOUT_SECONDS);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text) override;
  std::string generate(const std::string &prompt, const std::string &context) override;
  bool is_available() override;

  const std::string &url() const {
    return ollama_url_;
  }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  std::unique_ptr<ollama::Ollama> server_;
};

}  // namespace ragline_core
