#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "ragline_core/db/connection_pool.hpp"

namespace ragline_core {

class DatabaseError : public std::exception {
 public:
  explicit DatabaseError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class DatabaseManager
 * @brief Owns the schema and the connection pool for one SQLite database file.
 *
 * The schema is created on construction with a dedicated connection before the
 * pool is opened. Stores borrow connections through PooledConnection.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, int pool_size);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &path() const {
    return db_path_;
  }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_shut_down_ = false;
};

}  // namespace ragline_core
