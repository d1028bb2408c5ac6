#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ragline_api {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

class Config {
 public:
  static constexpr const char *DEFAULT_CONFIG_FILE = "raglinerc.json";
  static constexpr const char *CONFIG_ENV_VAR = "RAGLINE_CONFIG";

  std::string api_base_url;
  std::string database_path;
  int db_pool_size;

  // Language model
  std::string llm_provider;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int llm_timeout_seconds;

  // Retrieval
  std::string vector_index;
  int embedding_dimension;
  int top_k;
  int chunk_size_words;
  int chunk_overlap_words;

  int server_threads;

  // RAGLINE_CONFIG if set, otherwise raglinerc.json in the working directory
  static std::string resolve_path() {
    const char *from_env = std::getenv(CONFIG_ENV_VAR);
    if (from_env != nullptr && from_env[0] != '\0') {
      return from_env;
    }
    return DEFAULT_CONFIG_FILE;
  }

  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Config must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.database_path = json_config.value("database_path", std::string("./data/ragline.db"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.llm_provider = json_config.value("llm_provider", std::string("ollama"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.llm_timeout_seconds = json_config.value("llm_timeout_seconds", 120);

      config.vector_index = json_config.value("vector_index", std::string("faiss"));
      config.embedding_dimension = json_config.value("embedding_dimension", 768);
      config.top_k = json_config.value("top_k", 5);
      config.chunk_size_words = json_config.value("chunk_size_words", 512);
      config.chunk_overlap_words = json_config.value("chunk_overlap_words", 50);

      config.server_threads = json_config.value("server_threads", 4);
    } catch (const nlohmann::json::type_error &e) {
      throw ConfigError(std::string("Invalid config value type: ") + e.what());
    }

    config.validate();
    return config;
  }

  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }

  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw ConfigError("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw ConfigError("api_base_url must be host:port, got '" + api_base_url + "'");
    }
    if (database_path.empty()) {
      throw ConfigError("database_path cannot be empty");
    }
    if (db_pool_size <= 0) {
      throw ConfigError("db_pool_size must be greater than 0");
    }
    if (llm_provider != "ollama" && llm_provider != "stub") {
      throw ConfigError("llm_provider must be 'ollama' or 'stub', got '" + llm_provider + "'");
    }
    if (llm_provider == "ollama") {
      if (ollama_url.empty()) {
        throw ConfigError("ollama_url cannot be empty");
      }
      if (embedding_model.empty()) {
        throw ConfigError("embedding_model cannot be empty");
      }
      if (generation_model.empty()) {
        throw ConfigError("generation_model cannot be empty");
      }
    }
    if (llm_timeout_seconds <= 0) {
      throw ConfigError("llm_timeout_seconds must be greater than 0");
    }
    if (vector_index != "faiss" && vector_index != "memory") {
      throw ConfigError("vector_index must be 'faiss' or 'memory', got '" + vector_index + "'");
    }
    if (embedding_dimension <= 0) {
      throw ConfigError("embedding_dimension must be greater than 0");
    }
    if (top_k <= 0) {
      throw ConfigError("top_k must be greater than 0");
    }
    if (chunk_size_words <= 0) {
      throw ConfigError("chunk_size_words must be greater than 0");
    }
    if (chunk_overlap_words < 0 || chunk_overlap_words >= chunk_size_words) {
      throw ConfigError("chunk_overlap_words must be in [0, chunk_size_words)");
    }
    if (server_threads <= 0) {
      throw ConfigError("server_threads must be greater than 0");
    }
  }
};

}  // namespace ragline_api
