#pragma once

#include <nlohmann/json.hpp>

#include "ragline_core/types/fragment.hpp"
#include "ragline_core/types/interaction.hpp"
#include "ragline_core/types/knowledge_base.hpp"

// nlohmann::json conversions, found by ADL from json::get<T>() and json(value)
namespace ragline_core {

// FragmentMetadata is a std::map alias, so ADL cannot find these; call them directly
nlohmann::json metadata_to_json(const FragmentMetadata &metadata);
FragmentMetadata metadata_from_json(const nlohmann::json &j);

void to_json(nlohmann::json &j, const Citation &citation);
void from_json(const nlohmann::json &j, Citation &citation);

void to_json(nlohmann::json &j, const Interaction &interaction);
void to_json(nlohmann::json &j, const QueryResult &result);
void to_json(nlohmann::json &j, const KnowledgeBase &knowledge_base);
void to_json(nlohmann::json &j, const Document &document);

nlohmann::json citations_to_json(const std::vector<Citation> &citations);
std::vector<Citation> citations_from_json(const nlohmann::json &j);

}  // namespace ragline_core
