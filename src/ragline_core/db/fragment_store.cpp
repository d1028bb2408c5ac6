#include "ragline_core/db/fragment_store.hpp"

#include <sqlite_modern_cpp.h>

#include <cstring>

#include "ragline_core/db/pooled_connection.hpp"
#include "ragline_core/db/sqlite_error_utils.hpp"
#include "ragline_core/db/transaction.hpp"
#include "ragline_core/services/compression_service.hpp"
#include "ragline_core/types/json_serialization.hpp"

namespace ragline_core {

namespace {

std::vector<char> embedding_to_blob(const std::vector<float> &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_embedding(const std::vector<char> &blob) {
  if (blob.size() % sizeof(float) != 0) {
    throw FragmentStoreError("Embedding blob size " + std::to_string(blob.size()) +
                             " is not a multiple of float size");
  }
  std::vector<float> embedding(blob.size() / sizeof(float));
  std::memcpy(embedding.data(), blob.data(), blob.size());
  return embedding;
}

}  // namespace

FragmentStore::FragmentStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void FragmentStore::save_fragments(const std::vector<Fragment> &fragments) {
  if (fragments.empty()) {
    return;
  }

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    int position = 0;
    for (const auto &fragment : fragments) {
      std::vector<char> compressed = CompressionService::compress(fragment.content);
      std::string metadata = metadata_to_json(fragment.metadata).dump();
      if (fragment.embedding) {
        *conn << "INSERT INTO fragments (id, document_id, knowledge_base_id, position, content, "
                 "metadata, embedding) VALUES (?,?,?,?,?,?,?)"
              << fragment.id << fragment.document_id << fragment.knowledge_base_id << position
              << compressed << metadata << embedding_to_blob(*fragment.embedding);
      } else {
        *conn << "INSERT INTO fragments (id, document_id, knowledge_base_id, position, content, "
                 "metadata, embedding) VALUES (?,?,?,?,?,?,NULL)"
              << fragment.id << fragment.document_id << fragment.knowledge_base_id << position
              << compressed << metadata;
      }
      position++;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw FragmentStoreError(format_db_error("save_fragments", e));
  }
}

std::vector<Fragment> FragmentStore::load_where(const std::string &where_clause,
                                                const std::string &value) {
  try {
    std::vector<Fragment> fragments;
    PooledConnection conn(db_manager_);
    std::string query =
        "SELECT id, document_id, knowledge_base_id, content, metadata, embedding FROM fragments";
    if (!where_clause.empty()) {
      query += " WHERE " + where_clause;
    }
    query += " ORDER BY document_id, position";

    auto collect = [&](std::string id, std::string document_id, std::string knowledge_base_id,
                       std::vector<char> content, std::string metadata,
                       std::optional<std::vector<char>> embedding) {
      Fragment fragment;
      fragment.id = std::move(id);
      fragment.document_id = std::move(document_id);
      fragment.knowledge_base_id = std::move(knowledge_base_id);
      fragment.content = CompressionService::decompress(content);
      fragment.metadata = metadata_from_json(nlohmann::json::parse(metadata));
      if (embedding) {
        fragment.embedding = blob_to_embedding(*embedding);
      }
      fragments.push_back(std::move(fragment));
    };

    if (where_clause.empty()) {
      *conn << query >> collect;
    } else {
      *conn << query << value >> collect;
    }
    return fragments;
  } catch (const sqlite::sqlite_exception &e) {
    throw FragmentStoreError(format_db_error("load_fragments", e));
  } catch (const nlohmann::json::exception &e) {
    throw FragmentStoreError("Corrupt fragment metadata: " + std::string(e.what()));
  } catch (const CompressionError &e) {
    throw FragmentStoreError("Corrupt fragment content: " + std::string(e.what()));
  }
}

std::vector<Fragment> FragmentStore::load_all() {
  return load_where("", "");
}

std::vector<Fragment> FragmentStore::load_by_knowledge_base(const std::string &knowledge_base_id) {
  return load_where("knowledge_base_id = ?", knowledge_base_id);
}

std::vector<Fragment> FragmentStore::load_by_document(const std::string &document_id) {
  return load_where("document_id = ?", document_id);
}

int FragmentStore::delete_by_document(const std::string &document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM fragments WHERE document_id = ?" << document_id;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception &e) {
    throw FragmentStoreError(format_db_error("delete_fragments_by_document", e));
  }
}

int FragmentStore::delete_by_knowledge_base(const std::string &knowledge_base_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM fragments WHERE knowledge_base_id = ?" << knowledge_base_id;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception &e) {
    throw FragmentStoreError(format_db_error("delete_fragments_by_knowledge_base", e));
  }
}

int FragmentStore::count(const std::string &knowledge_base_id) {
  try {
    int total = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM fragments WHERE knowledge_base_id = ?" << knowledge_base_id >>
        total;
    return total;
  } catch (const sqlite::sqlite_exception &e) {
    throw FragmentStoreError(format_db_error("count_fragments", e));
  }
}

}  // namespace ragline_core
