#include "ragline_core/db/sqlite_interaction_store.hpp"

#include <sqlite_modern_cpp.h>

#include <algorithm>

#include "ragline_core/db/pooled_connection.hpp"
#include "ragline_core/db/sqlite_error_utils.hpp"
#include "ragline_core/types/json_serialization.hpp"
#include "ragline_core/utils/time_utils.hpp"

namespace ragline_core {

namespace {

const char *const kSelectInteraction =
    "SELECT id, knowledge_base_id, question, answer, status, citations_json, created_at "
    "FROM interactions";

Interaction make_interaction(std::string id,
                             std::string knowledge_base_id,
                             std::string question,
                             std::optional<std::string> answer,
                             const std::string &status,
                             const std::string &citations_json,
                             const std::string &created_at) {
  Interaction interaction;
  interaction.id = std::move(id);
  interaction.knowledge_base_id = std::move(knowledge_base_id);
  interaction.question = std::move(question);
  interaction.answer = std::move(answer);
  interaction.status = interaction_status_from_string(status);
  interaction.citations = citations_from_json(nlohmann::json::parse(citations_json));
  interaction.created_at = string_to_time_point(created_at);
  return interaction;
}

}  // namespace

SqliteInteractionStore::SqliteInteractionStore(DatabaseManager &db_manager)
    : db_manager_(db_manager) {}

void SqliteInteractionStore::save(const Interaction &interaction) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO interactions (id, knowledge_base_id, question, answer, status, "
             "citations_json, created_at) VALUES (?,?,?,?,?,?,?)"
          << interaction.id << interaction.knowledge_base_id << interaction.question
          << interaction.answer << to_string(interaction.status)
          << citations_to_json(interaction.citations).dump()
          << time_point_to_string(interaction.created_at);
  } catch (const sqlite::sqlite_exception &e) {
    throw InteractionStoreError(format_db_error("save_interaction", e));
  }
}

std::optional<Interaction> SqliteInteractionStore::get(const std::string &id) {
  try {
    std::optional<Interaction> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(kSelectInteraction) + " WHERE id = ?" << id >>
        [&](std::string interaction_id, std::string knowledge_base_id, std::string question,
            std::optional<std::string> answer, std::string status, std::string citations_json,
            std::string created_at) {
          result = make_interaction(std::move(interaction_id), std::move(knowledge_base_id),
                                    std::move(question), std::move(answer), status,
                                    citations_json, created_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw InteractionStoreError(format_db_error("get_interaction", e));
  } catch (const nlohmann::json::exception &e) {
    throw InteractionStoreError("Corrupt citations for interaction " + id + ": " + e.what());
  }
}

std::vector<Interaction> SqliteInteractionStore::list(
    const std::optional<std::string> &knowledge_base_id, int limit, int offset) {
  if (limit <= 0) {
    return {};
  }
  offset = std::max(offset, 0);

  try {
    std::vector<Interaction> result;
    PooledConnection conn(db_manager_);
    auto collect = [&](std::string interaction_id, std::string kb_id, std::string question,
                       std::optional<std::string> answer, std::string status,
                       std::string citations_json, std::string created_at) {
      result.push_back(make_interaction(std::move(interaction_id), std::move(kb_id),
                                        std::move(question), std::move(answer), status,
                                        citations_json, created_at));
    };

    if (knowledge_base_id) {
      *conn << std::string(kSelectInteraction) +
                   " WHERE knowledge_base_id = ? ORDER BY created_at DESC, rowid DESC "
                   "LIMIT ? OFFSET ?"
            << *knowledge_base_id << limit << offset >>
          collect;
    } else {
      *conn << std::string(kSelectInteraction) +
                   " ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?"
            << limit << offset >>
          collect;
    }
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw InteractionStoreError(format_db_error("list_interactions", e));
  } catch (const nlohmann::json::exception &e) {
    throw InteractionStoreError("Corrupt citations in interaction log: " + std::string(e.what()));
  }
}

std::map<InteractionStatus, int> SqliteInteractionStore::count_by_status(
    const std::optional<std::string> &knowledge_base_id) {
  try {
    std::map<InteractionStatus, int> counts = {{InteractionStatus::ANSWERED, 0},
                                               {InteractionStatus::UNKNOWN, 0},
                                               {InteractionStatus::ERROR, 0}};
    PooledConnection conn(db_manager_);
    auto collect = [&](std::string status, int count) {
      counts[interaction_status_from_string(status)] = count;
    };

    if (knowledge_base_id) {
      *conn << "SELECT status, COUNT(*) FROM interactions WHERE knowledge_base_id = ? "
               "GROUP BY status"
            << *knowledge_base_id >>
          collect;
    } else {
      *conn << "SELECT status, COUNT(*) FROM interactions GROUP BY status" >> collect;
    }
    return counts;
  } catch (const sqlite::sqlite_exception &e) {
    throw InteractionStoreError(format_db_error("count_interactions_by_status", e));
  }
}

}  // namespace ragline_core
