#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragline_api/config.hpp"
#include "ragline_api/routes.hpp"
#include "ragline_api/server.hpp"
#include "ragline_core/db/database_manager.hpp"
#include "ragline_core/db/fragment_store.hpp"
#include "ragline_core/db/knowledge_base_store.hpp"
#include "ragline_core/db/sqlite_interaction_store.hpp"
#include "ragline_core/extractors/content_extractor_factory.hpp"
#include "ragline_core/llm/ollama_client.hpp"
#include "ragline_core/llm/stub_language_model.hpp"
#include "ragline_core/services/document_service.hpp"
#include "ragline_core/services/interaction_service.hpp"
#include "ragline_core/services/knowledge_base_service.hpp"
#include "ragline_core/services/query_service.hpp"
#include "ragline_core/vector/vector_index_factory.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

std::shared_ptr<ragline_core::LanguageModel> make_language_model(const ragline_api::Config &config) {
  if (config.llm_provider == "stub") {
    return std::make_shared<ragline_core::StubLanguageModel>(
        static_cast<size_t>(config.embedding_dimension));
  }
  return std::make_shared<ragline_core::OllamaClient>(config.ollama_url, config.embedding_model,
                                                      config.generation_model,
                                                      config.llm_timeout_seconds);
}

int main() {
  try {
    const std::string config_path = ragline_api::Config::resolve_path();
    ragline_api::Config config = ragline_api::Config::from_file(config_path);

    std::cout << "Starting ragline API Server..." << std::endl;
    std::cout << "Config File: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Database Path: " << config.database_path << std::endl;
    std::cout << "LLM Provider: " << config.llm_provider << std::endl;
    if (config.llm_provider == "ollama") {
      std::cout << "Ollama URL: " << config.ollama_url << std::endl;
      std::cout << "Embedding Model: " << config.embedding_model << std::endl;
      std::cout << "Generation Model: " << config.generation_model << std::endl;
    }
    std::cout << "Vector Index: " << config.vector_index << " (dimension "
              << config.embedding_dimension << ")" << std::endl;

    // Initialize core components
    auto language_model = make_language_model(config);
    if (!language_model->is_available()) {
      std::cerr << "Warning: language model is not reachable; queries will return errors until "
                   "it is"
                << std::endl;
    }

    ragline_core::DatabaseManager db_manager(config.database_path, config.db_pool_size);
    auto knowledge_base_store = std::make_shared<ragline_core::KnowledgeBaseStore>(db_manager);
    auto fragment_store = std::make_shared<ragline_core::FragmentStore>(db_manager);
    auto interaction_store = std::make_shared<ragline_core::SqliteInteractionStore>(db_manager);

    auto vector_index = ragline_core::create_vector_index(
        config.vector_index, static_cast<size_t>(config.embedding_dimension));
    ragline_core::restore_vector_index(*vector_index, *fragment_store);

    auto extractor_factory = std::make_shared<ragline_core::ContentExtractorFactory>();
    ragline_core::ChunkingOptions chunking_options;
    chunking_options.max_words = static_cast<size_t>(config.chunk_size_words);
    chunking_options.overlap_words = static_cast<size_t>(config.chunk_overlap_words);

    auto scope_locks = std::make_shared<ragline_core::ScopeLocks>();
    auto knowledge_base_service = std::make_shared<ragline_core::KnowledgeBaseService>(
        knowledge_base_store, fragment_store, vector_index, scope_locks);
    auto document_service = std::make_shared<ragline_core::DocumentService>(
        knowledge_base_store, fragment_store, vector_index, language_model, extractor_factory,
        scope_locks, chunking_options);
    document_service->recover_interrupted_ingestions();
    ragline_core::QueryOptions query_options;
    query_options.top_k = config.top_k;
    auto query_service = std::make_shared<ragline_core::QueryService>(
        language_model, vector_index, interaction_store, query_options);
    auto interaction_service = std::make_shared<ragline_core::InteractionService>(
        interaction_store, knowledge_base_store);

    ragline_api::Server server(config.host(), config.port(), config.server_threads);
    ragline_api::Routes routes(knowledge_base_service, document_service, query_service,
                               interaction_service, language_model);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
