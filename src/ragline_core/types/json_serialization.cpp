#include "ragline_core/types/json_serialization.hpp"

#include "ragline_core/utils/time_utils.hpp"

namespace ragline_core {

nlohmann::json metadata_to_json(const FragmentMetadata &metadata) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[key, value] : metadata) {
    if (const auto *text = std::get_if<std::string>(&value)) {
      j[key] = *text;
    } else {
      j[key] = std::get<int>(value);
    }
  }
  return j;
}

FragmentMetadata metadata_from_json(const nlohmann::json &j) {
  FragmentMetadata metadata;
  for (const auto &[key, value] : j.items()) {
    if (value.is_number_integer()) {
      metadata[key] = value.get<int>();
    } else if (value.is_string()) {
      metadata[key] = value.get<std::string>();
    } else {
      // Anything else is kept in its JSON text form
      metadata[key] = value.dump();
    }
  }
  return metadata;
}

void to_json(nlohmann::json &j, const Citation &citation) {
  j = nlohmann::json{{"source_document", citation.source_document},
                     {"page", nullptr},
                     {"chunk_id", citation.fragment_id},
                     {"relevance_score", citation.relevance_score}};
  if (citation.page) {
    j["page"] = *citation.page;
  }
}

void from_json(const nlohmann::json &j, Citation &citation) {
  citation.source_document = j.value("source_document", "");
  citation.fragment_id = j.value("chunk_id", "");
  citation.relevance_score = j.value("relevance_score", 0.0);
  if (j.contains("page") && j["page"].is_number_integer()) {
    citation.page = j["page"].get<int>();
  } else {
    citation.page.reset();
  }
}

nlohmann::json citations_to_json(const std::vector<Citation> &citations) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto &citation : citations) {
    array.push_back(citation);
  }
  return array;
}

std::vector<Citation> citations_from_json(const nlohmann::json &j) {
  std::vector<Citation> citations;
  if (!j.is_array()) {
    return citations;
  }
  for (const auto &item : j) {
    citations.push_back(item.get<Citation>());
  }
  return citations;
}

void to_json(nlohmann::json &j, const Interaction &interaction) {
  j = nlohmann::json{{"id", interaction.id},
                     {"knowledge_base_id", interaction.knowledge_base_id},
                     {"question", interaction.question},
                     {"answer", nullptr},
                     {"status", to_string(interaction.status)},
                     {"citations", citations_to_json(interaction.citations)},
                     {"created_at", time_point_to_string(interaction.created_at)}};
  if (interaction.answer) {
    j["answer"] = *interaction.answer;
  }
}

void to_json(nlohmann::json &j, const QueryResult &result) {
  j = nlohmann::json{{"status", to_string(result.status)},
                     {"answer", nullptr},
                     {"citations", citations_to_json(result.citations)},
                     {"interaction_id", result.interaction_id}};
  if (result.answer) {
    j["answer"] = *result.answer;
  }
}

void to_json(nlohmann::json &j, const KnowledgeBase &knowledge_base) {
  j = nlohmann::json{{"id", knowledge_base.id},
                     {"name", knowledge_base.name},
                     {"description", nullptr},
                     {"created_at", time_point_to_string(knowledge_base.created_at)},
                     {"updated_at", time_point_to_string(knowledge_base.updated_at)}};
  if (knowledge_base.description) {
    j["description"] = *knowledge_base.description;
  }
}

void to_json(nlohmann::json &j, const Document &document) {
  j = nlohmann::json{{"id", document.id},
                     {"knowledge_base_id", document.knowledge_base_id},
                     {"filename", document.filename},
                     {"content_hash", document.content_hash},
                     {"status", to_string(document.status)},
                     {"chunks_count", document.chunks_count},
                     {"uploaded_at", time_point_to_string(document.uploaded_at)}};
  if (document.error_message) {
    j["error_message"] = *document.error_message;
  }
}

}  // namespace ragline_core
