#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "server.hpp"

namespace ragline_core {
class DocumentService;
class InteractionService;
class KnowledgeBaseService;
class LanguageModel;
class QueryService;
}  // namespace ragline_core

namespace ragline_api {

class Routes {
 public:
  static constexpr const char *API_VERSION = "0.1.0";

  Routes(std::shared_ptr<ragline_core::KnowledgeBaseService> knowledge_base_service,
         std::shared_ptr<ragline_core::DocumentService> document_service,
         std::shared_ptr<ragline_core::QueryService> query_service,
         std::shared_ptr<ragline_core::InteractionService> interaction_service,
         std::shared_ptr<ragline_core::LanguageModel> language_model);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Route handlers; public so they can be exercised without a running server
  crow::response handle_health_check(const crow::request &req);

  crow::response handle_create_knowledge_base(const crow::request &req);
  crow::response handle_list_knowledge_bases(const crow::request &req);
  crow::response handle_get_knowledge_base(const crow::request &req, const std::string &kb_id);
  crow::response handle_delete_knowledge_base(const crow::request &req, const std::string &kb_id);

  crow::response handle_upload_document(const crow::request &req, const std::string &kb_id);
  crow::response handle_list_documents(const crow::request &req, const std::string &kb_id);
  crow::response handle_delete_document(const crow::request &req,
                                        const std::string &kb_id,
                                        const std::string &document_id);

  crow::response handle_query(const crow::request &req);

  crow::response handle_list_interactions(const crow::request &req);
  crow::response handle_get_interaction(const crow::request &req,
                                        const std::string &interaction_id);
  crow::response handle_dashboard_stats(const crow::request &req);

 private:
  std::shared_ptr<ragline_core::KnowledgeBaseService> knowledge_base_service_;
  std::shared_ptr<ragline_core::DocumentService> document_service_;
  std::shared_ptr<ragline_core::QueryService> query_service_;
  std::shared_ptr<ragline_core::InteractionService> interaction_service_;
  std::shared_ptr<ragline_core::LanguageModel> language_model_;

  // Helper methods
  template <typename Handler>
  crow::response guarded(const std::string &handler_name, Handler &&handler);

  static nlohmann::json parse_json_body(const std::string &body);
  static std::string require_string_field(const nlohmann::json &body, const std::string &field);
  static int int_url_param(const crow::request &req, const std::string &name, int default_value);
  static nlohmann::json create_success_response(const std::string &message,
                                                const nlohmann::json &data = nlohmann::json{});
  static nlohmann::json create_error_response(const std::string &error);
  static crow::response create_json_response(const nlohmann::json &json_data,
                                             int status_code = 200);
};

}  // namespace ragline_api
