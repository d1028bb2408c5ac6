#include "ragline_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ragline_core/db/interaction_store.hpp"
#include "ragline_core/llm/language_model.hpp"
#include "ragline_core/services/document_service.hpp"
#include "ragline_core/services/interaction_service.hpp"
#include "ragline_core/services/knowledge_base_service.hpp"
#include "ragline_core/services/query_service.hpp"
#include "ragline_core/services/service_errors.hpp"
#include "ragline_core/types/json_serialization.hpp"

namespace ragline_api {

Routes::Routes(std::shared_ptr<ragline_core::KnowledgeBaseService> knowledge_base_service,
               std::shared_ptr<ragline_core::DocumentService> document_service,
               std::shared_ptr<ragline_core::QueryService> query_service,
               std::shared_ptr<ragline_core::InteractionService> interaction_service,
               std::shared_ptr<ragline_core::LanguageModel> language_model)
    : knowledge_base_service_(std::move(knowledge_base_service)),
      document_service_(std::move(document_service)),
      query_service_(std::move(query_service)),
      interaction_service_(std::move(interaction_service)),
      language_model_(std::move(language_model)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Knowledge bases
  CROW_ROUTE(app, "/api/v1/knowledge-bases")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_create_knowledge_base(req); });

  CROW_ROUTE(app, "/api/v1/knowledge-bases")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_knowledge_bases(req); });

  CROW_ROUTE(app, "/api/v1/knowledge-bases/<string>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, const std::string &kb_id) {
        return handle_get_knowledge_base(req, kb_id);
      });

  CROW_ROUTE(app, "/api/v1/knowledge-bases/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &kb_id) {
            return handle_delete_knowledge_base(req, kb_id);
          });

  // Documents
  CROW_ROUTE(app, "/api/v1/knowledge-bases/<string>/documents")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &kb_id) {
        return handle_upload_document(req, kb_id);
      });

  CROW_ROUTE(app, "/api/v1/knowledge-bases/<string>/documents")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, const std::string &kb_id) {
        return handle_list_documents(req, kb_id);
      });

  CROW_ROUTE(app, "/api/v1/knowledge-bases/<string>/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &kb_id,
                                                const std::string &document_id) {
        return handle_delete_document(req, kb_id, document_id);
      });

  // Query
  CROW_ROUTE(app, "/api/v1/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  // Interaction log
  CROW_ROUTE(app, "/api/v1/interactions")
  ([this](const crow::request &req) { return handle_list_interactions(req); });

  CROW_ROUTE(app, "/api/v1/interactions/<string>")
  ([this](const crow::request &req, const std::string &interaction_id) {
    return handle_get_interaction(req, interaction_id);
  });

  CROW_ROUTE(app, "/api/v1/dashboard/stats")
  ([this](const crow::request &req) { return handle_dashboard_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

template <typename Handler>
crow::response Routes::guarded(const std::string &handler_name, Handler &&handler) {
  try {
    return handler();
  } catch (const ragline_core::ValidationError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const ragline_core::NotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << handler_name << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response = create_success_response("ragline API is running");
  response["version"] = API_VERSION;
  response["status"] = "healthy";
  response["llm_available"] = language_model_->is_available();
  return create_json_response(response);
}

crow::response Routes::handle_create_knowledge_base(const crow::request &req) {
  return guarded("handle_create_knowledge_base", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string name = require_string_field(body, "name");
    std::optional<std::string> description;
    if (body.contains("description") && body["description"].is_string()) {
      description = body["description"].get<std::string>();
    }

    ragline_core::KnowledgeBase knowledge_base = knowledge_base_service_->create(name, description);
    return create_json_response(
        create_success_response("Knowledge base created", nlohmann::json(knowledge_base)), 201);
  });
}

crow::response Routes::handle_list_knowledge_bases(const crow::request & /*req*/) {
  return guarded("handle_list_knowledge_bases", [&] {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &knowledge_base : knowledge_base_service_->list()) {
      items.push_back(knowledge_base);
    }
    nlohmann::json data;
    data["knowledge_bases"] = items;
    data["count"] = items.size();
    return create_json_response(create_success_response("Knowledge bases retrieved", data));
  });
}

crow::response Routes::handle_get_knowledge_base(const crow::request & /*req*/,
                                                 const std::string &kb_id) {
  return guarded("handle_get_knowledge_base", [&] {
    nlohmann::json data = knowledge_base_service_->get(kb_id);
    data["documents_count"] = document_service_->list_documents(kb_id).size();
    return create_json_response(create_success_response("Knowledge base retrieved", data));
  });
}

crow::response Routes::handle_delete_knowledge_base(const crow::request & /*req*/,
                                                    const std::string &kb_id) {
  return guarded("handle_delete_knowledge_base", [&] {
    knowledge_base_service_->remove(kb_id);
    return create_json_response(create_success_response("Knowledge base deleted"));
  });
}

crow::response Routes::handle_upload_document(const crow::request &req, const std::string &kb_id) {
  return guarded("handle_upload_document", [&] {
    nlohmann::json body = parse_json_body(req.body);

    ragline_core::Document document;
    if (body.contains("file_path")) {
      std::string file_path = require_string_field(body, "file_path");
      std::cout << "Ingesting file " << file_path << " into " << kb_id << std::endl;
      document = document_service_->ingest_file(kb_id, file_path);
    } else if (body.contains("content")) {
      std::string filename = require_string_field(body, "filename");
      if (!body["content"].is_string()) {
        throw ragline_core::ValidationError("content must be a string");
      }
      document = document_service_->ingest_text(kb_id, filename, body["content"].get<std::string>());
    } else {
      throw ragline_core::ValidationError("Request needs either file_path or filename and content");
    }

    return create_json_response(
        create_success_response("Document indexed", nlohmann::json(document)), 201);
  });
}

crow::response Routes::handle_list_documents(const crow::request & /*req*/,
                                             const std::string &kb_id) {
  return guarded("handle_list_documents", [&] {
    nlohmann::json items = nlohmann::json::array();
    for (const auto &document : document_service_->list_documents(kb_id)) {
      items.push_back(document);
    }
    nlohmann::json data;
    data["documents"] = items;
    data["count"] = items.size();
    return create_json_response(create_success_response("Documents retrieved", data));
  });
}

crow::response Routes::handle_delete_document(const crow::request & /*req*/,
                                              const std::string &kb_id,
                                              const std::string &document_id) {
  return guarded("handle_delete_document", [&] {
    document_service_->delete_document(kb_id, document_id);
    return create_json_response(create_success_response("Document deleted"));
  });
}

crow::response Routes::handle_query(const crow::request &req) {
  return guarded("handle_query", [&] {
    nlohmann::json body = parse_json_body(req.body);
    std::string kb_id = require_string_field(body, "knowledge_base_id");
    std::string question = require_string_field(body, "question");

    std::cout << "Query on " << kb_id << ": " << question << std::endl;
    ragline_core::QueryResult result = query_service_->execute(kb_id, question);
    return create_json_response(create_success_response("Query completed", nlohmann::json(result)));
  });
}

crow::response Routes::handle_list_interactions(const crow::request &req) {
  return guarded("handle_list_interactions", [&] {
    std::optional<std::string> kb_id;
    if (const char *value = req.url_params.get("kb_id")) {
      kb_id = std::string(value);
    }
    int limit = int_url_param(req, "limit", ragline_core::InteractionStore::DEFAULT_LIST_LIMIT);
    int offset = int_url_param(req, "offset", 0);

    nlohmann::json items = nlohmann::json::array();
    for (const auto &interaction : interaction_service_->list(kb_id, limit, offset)) {
      items.push_back(interaction);
    }
    nlohmann::json data;
    data["interactions"] = items;
    data["count"] = items.size();
    data["limit"] = limit;
    data["offset"] = offset;
    return create_json_response(create_success_response("Interactions retrieved", data));
  });
}

crow::response Routes::handle_get_interaction(const crow::request & /*req*/,
                                              const std::string &interaction_id) {
  return guarded("handle_get_interaction", [&] {
    nlohmann::json data = interaction_service_->get(interaction_id);
    return create_json_response(create_success_response("Interaction retrieved", data));
  });
}

crow::response Routes::handle_dashboard_stats(const crow::request & /*req*/) {
  return guarded("handle_dashboard_stats", [&] {
    ragline_core::DashboardStats stats = interaction_service_->dashboard_stats();
    nlohmann::json data;
    data["total_interactions"] = stats.total_interactions;
    data["answered_count"] = stats.answered_count;
    data["unknown_count"] = stats.unknown_count;
    data["error_count"] = stats.error_count;
    data["knowledge_base_count"] = stats.knowledge_base_count;
    data["document_count"] = stats.document_count;
    return create_json_response(create_success_response("Dashboard stats retrieved", data));
  });
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  nlohmann::json parsed = nlohmann::json::parse(body);
  if (!parsed.is_object()) {
    throw ragline_core::ValidationError("Request body must be a JSON object");
  }
  return parsed;
}

std::string Routes::require_string_field(const nlohmann::json &body, const std::string &field) {
  if (!body.contains(field) || !body[field].is_string()) {
    throw ragline_core::ValidationError(field + " is required");
  }
  std::string value = body[field].get<std::string>();
  if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw ragline_core::ValidationError(field + " must not be empty");
  }
  return value;
}

int Routes::int_url_param(const crow::request &req, const std::string &name, int default_value) {
  const char *value = req.url_params.get(name);
  if (value == nullptr) {
    return default_value;
  }
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (value[consumed] != '\0') {
      throw ragline_core::ValidationError(name + " must be an integer");
    }
    return parsed;
  } catch (const std::invalid_argument &) {
    throw ragline_core::ValidationError(name + " must be an integer");
  } catch (const std::out_of_range &) {
    throw ragline_core::ValidationError(name + " is out of range");
  }
}

}  // namespace ragline_api
