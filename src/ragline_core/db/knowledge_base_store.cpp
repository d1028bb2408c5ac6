#include "ragline_core/db/knowledge_base_store.hpp"

#include <sqlite_modern_cpp.h>

#include "ragline_core/db/pooled_connection.hpp"
#include "ragline_core/db/sqlite_error_utils.hpp"
#include "ragline_core/db/transaction.hpp"
#include "ragline_core/utils/time_utils.hpp"

namespace ragline_core {

namespace {

const char *const kSelectKnowledgeBase =
    "SELECT id, name, description, created_at, updated_at FROM knowledge_bases";

const char *const kSelectDocument =
    "SELECT id, knowledge_base_id, filename, content_hash, status, chunks_count, error_message, "
    "uploaded_at FROM documents";

KnowledgeBase make_knowledge_base(std::string id,
                                  std::string name,
                                  std::optional<std::string> description,
                                  const std::string &created_at,
                                  const std::string &updated_at) {
  KnowledgeBase knowledge_base;
  knowledge_base.id = std::move(id);
  knowledge_base.name = std::move(name);
  knowledge_base.description = std::move(description);
  knowledge_base.created_at = string_to_time_point(created_at);
  knowledge_base.updated_at = string_to_time_point(updated_at);
  return knowledge_base;
}

Document make_document(std::string id,
                       std::string knowledge_base_id,
                       std::string filename,
                       std::string content_hash,
                       const std::string &status,
                       int chunks_count,
                       std::optional<std::string> error_message,
                       const std::string &uploaded_at) {
  Document document;
  document.id = std::move(id);
  document.knowledge_base_id = std::move(knowledge_base_id);
  document.filename = std::move(filename);
  document.content_hash = std::move(content_hash);
  document.status = document_status_from_string(status);
  document.chunks_count = chunks_count;
  document.error_message = std::move(error_message);
  document.uploaded_at = string_to_time_point(uploaded_at);
  return document;
}

}  // namespace

KnowledgeBaseStore::KnowledgeBaseStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

void KnowledgeBaseStore::create_knowledge_base(const KnowledgeBase &knowledge_base) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO knowledge_bases (id, name, description, created_at, updated_at) "
             "VALUES (?,?,?,?,?)"
          << knowledge_base.id << knowledge_base.name << knowledge_base.description
          << time_point_to_string(knowledge_base.created_at)
          << time_point_to_string(knowledge_base.updated_at);
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("create_knowledge_base", e));
  }
}

std::optional<KnowledgeBase> KnowledgeBaseStore::get_knowledge_base(const std::string &id) {
  try {
    std::optional<KnowledgeBase> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(kSelectKnowledgeBase) + " WHERE id = ?" << id >>
        [&](std::string kb_id, std::string name, std::optional<std::string> description,
            std::string created_at, std::string updated_at) {
          result = make_knowledge_base(std::move(kb_id), std::move(name), std::move(description),
                                       created_at, updated_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("get_knowledge_base", e));
  }
}

std::vector<KnowledgeBase> KnowledgeBaseStore::list_knowledge_bases() {
  try {
    std::vector<KnowledgeBase> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(kSelectKnowledgeBase) + " ORDER BY created_at DESC, rowid DESC" >>
        [&](std::string kb_id, std::string name, std::optional<std::string> description,
            std::string created_at, std::string updated_at) {
          result.push_back(make_knowledge_base(std::move(kb_id), std::move(name),
                                               std::move(description), created_at, updated_at));
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("list_knowledge_bases", e));
  }
}

bool KnowledgeBaseStore::knowledge_base_exists(const std::string &id) {
  try {
    bool exists = false;
    PooledConnection conn(db_manager_);
    *conn << "SELECT 1 FROM knowledge_bases WHERE id = ? LIMIT 1" << id >>
        [&](int /*dummy*/) { exists = true; };
    return exists;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("knowledge_base_exists", e));
  }
}

bool KnowledgeBaseStore::delete_knowledge_base(const std::string &id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM knowledge_bases WHERE id = ?" << id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("delete_knowledge_base", e));
  }
}

void KnowledgeBaseStore::touch_knowledge_base(const std::string &id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE knowledge_bases SET updated_at = ? WHERE id = ?"
          << time_point_to_string(std::chrono::system_clock::now()) << id;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("touch_knowledge_base", e));
  }
}

int KnowledgeBaseStore::count_knowledge_bases() {
  try {
    int count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM knowledge_bases" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("count_knowledge_bases", e));
  }
}

void KnowledgeBaseStore::save_document(const Document &document) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO documents (id, knowledge_base_id, filename, content_hash, status, "
             "chunks_count, error_message, uploaded_at) VALUES (?,?,?,?,?,?,?,?)"
          << document.id << document.knowledge_base_id << document.filename
          << document.content_hash << to_string(document.status) << document.chunks_count
          << document.error_message << time_point_to_string(document.uploaded_at);
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("save_document", e));
  }
}

std::optional<Document> KnowledgeBaseStore::get_document(const std::string &id) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(kSelectDocument) + " WHERE id = ?" << id >>
        [&](std::string doc_id, std::string knowledge_base_id, std::string filename,
            std::string content_hash, std::string status, int chunks_count,
            std::optional<std::string> error_message, std::string uploaded_at) {
          result = make_document(std::move(doc_id), std::move(knowledge_base_id),
                                 std::move(filename), std::move(content_hash), status,
                                 chunks_count, std::move(error_message), uploaded_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("get_document", e));
  }
}

std::vector<Document> KnowledgeBaseStore::list_documents(const std::string &knowledge_base_id) {
  try {
    std::vector<Document> result;
    PooledConnection conn(db_manager_);
    *conn << std::string(kSelectDocument) +
                 " WHERE knowledge_base_id = ? ORDER BY uploaded_at DESC, rowid DESC"
          << knowledge_base_id >>
        [&](std::string doc_id, std::string kb_id, std::string filename,
            std::string content_hash, std::string status, int chunks_count,
            std::optional<std::string> error_message, std::string uploaded_at) {
          result.push_back(make_document(std::move(doc_id), std::move(kb_id),
                                         std::move(filename), std::move(content_hash), status,
                                         chunks_count, std::move(error_message), uploaded_at));
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("list_documents", e));
  }
}

void KnowledgeBaseStore::update_document_status(const std::string &id,
                                                DocumentStatus status,
                                                int chunks_count,
                                                const std::optional<std::string> &error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE documents SET status = ?, chunks_count = ?, error_message = ? WHERE id = ?"
          << to_string(status) << chunks_count << error_message << id;
    if (conn->rows_modified() == 0) {
      throw KnowledgeBaseStoreError("Document with ID " + id + " not found");
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("update_document_status", e));
  }
}

bool KnowledgeBaseStore::delete_document(const std::string &id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE id = ?" << id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("delete_document", e));
  }
}

std::vector<std::string> KnowledgeBaseStore::fail_unfinished_documents(
    const std::string &error_message) {
  try {
    std::vector<std::string> ids;
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);
    *conn << "SELECT id FROM documents WHERE status IN (?, ?)"
          << to_string(DocumentStatus::PENDING) << to_string(DocumentStatus::PROCESSING) >>
        [&](std::string id) { ids.push_back(std::move(id)); };
    *conn << "UPDATE documents SET status = ?, chunks_count = 0, error_message = ? "
             "WHERE status IN (?, ?)"
          << to_string(DocumentStatus::ERROR) << error_message
          << to_string(DocumentStatus::PENDING) << to_string(DocumentStatus::PROCESSING);
    tx.commit();
    return ids;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("fail_unfinished_documents", e));
  }
}

int KnowledgeBaseStore::count_documents(const std::optional<std::string> &knowledge_base_id) {
  try {
    int count = 0;
    PooledConnection conn(db_manager_);
    if (knowledge_base_id) {
      *conn << "SELECT COUNT(*) FROM documents WHERE knowledge_base_id = ?" << *knowledge_base_id >>
          count;
    } else {
      *conn << "SELECT COUNT(*) FROM documents" >> count;
    }
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw KnowledgeBaseStoreError(format_db_error("count_documents", e));
  }
}

}  // namespace ragline_core
