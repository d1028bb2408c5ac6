#include "ragline_core/db/database_manager.hpp"

#include "ragline_core/db/sqlite_error_utils.hpp"

namespace ragline_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path, int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      throw DatabaseError("Failed to create database directory " +
                          db_path_.parent_path().string() + ": " + ec.message());
    }
  }

  try {
    setup_schema();
    pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size);
  } catch (const sqlite::sqlite_exception &e) {
    throw DatabaseError(format_db_error("open database " + db_path_.string(), e));
  }
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw DatabaseError("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema() {
  sqlite::database db(db_path_.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS knowledge_bases (
          id TEXT PRIMARY KEY,
          name TEXT NOT NULL,
          description TEXT,
          created_at TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id TEXT PRIMARY KEY,
          knowledge_base_id TEXT NOT NULL,
          filename TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          status TEXT NOT NULL DEFAULT 'pending',
          chunks_count INTEGER NOT NULL DEFAULT 0,
          error_message TEXT,
          uploaded_at TEXT NOT NULL,
          FOREIGN KEY (knowledge_base_id) REFERENCES knowledge_bases(id) ON DELETE CASCADE
      )
    )";

  // content is zstd-compressed; embedding is raw float32
  db << R"(
      CREATE TABLE IF NOT EXISTS fragments (
          id TEXT PRIMARY KEY,
          document_id TEXT NOT NULL,
          knowledge_base_id TEXT NOT NULL,
          position INTEGER NOT NULL,
          content BLOB NOT NULL,
          metadata TEXT NOT NULL,
          embedding BLOB,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  db << R"(
      CREATE TABLE IF NOT EXISTS interactions (
          id TEXT PRIMARY KEY,
          knowledge_base_id TEXT NOT NULL,
          question TEXT NOT NULL,
          answer TEXT,
          status TEXT NOT NULL,
          citations_json TEXT NOT NULL DEFAULT '[]',
          created_at TEXT NOT NULL
      )
    )";

  db << "CREATE INDEX IF NOT EXISTS idx_documents_kb ON documents(knowledge_base_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_document ON fragments(document_id, position)";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_kb ON fragments(knowledge_base_id)";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_interactions_kb_created
      ON interactions(knowledge_base_id, created_at)
    )";
}

}  // namespace ragline_core
