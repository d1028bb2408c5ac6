#include "ragline_core/llm/ollama_client.hpp"

#include <nlohmann/json.hpp>

#include "ollama.hpp"

namespace ragline_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      server_(std::make_unique<ollama::Ollama>(ollama_url)) {
  if (timeout_seconds <= 0) {
    throw LanguageModelError("Ollama timeout must be positive, got " +
                             std::to_string(timeout_seconds));
  }
  server_->setReadTimeout(timeout_seconds);
  server_->setWriteTimeout(timeout_seconds);
}

OllamaClient::~OllamaClient() = default;

std::vector<float> OllamaClient::embed(const std::string &text) {
  try {
    ollama::response response = server_->generate_embeddings(embedding_model_, text);
    nlohmann::json json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw LanguageModelError("Response does not contain embeddings field");
    }

    const auto &embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw LanguageModelError("Embeddings field is not a non-empty array");
    }
    // One input, so the first vector of the batch is ours
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw LanguageModelError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw LanguageModelError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt, const std::string &context) {
  const std::string full_prompt = context.empty() ? prompt : context + "\n\n" + prompt;
  try {
    ollama::response response = server_->generate(generation_model_, full_prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw LanguageModelError("Text generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw LanguageModelError("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_available() {
  return server_->is_running();
}

}  // namespace ragline_core
