#pragma once

#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <memory>
#include <string>

namespace vidsearch_core {

/*
Owns the process-wide SQLite connection for one storage root. Construct once at startup and
share it; the schema is created on first open.
*/
class DatabaseManager {
 public:
  static constexpr const char *DB_FILE_NAME = "vidsearch.db";

  // Throws std::runtime_error if the database cannot be opened or the schema created
  explicit DatabaseManager(const std::filesystem::path &storage_root);

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  sqlite::database &database() {
    return *db_;
  }

  const std::filesystem::path &db_path() const {
    return db_path_;
  }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<sqlite::database> db_;
};

}  // namespace vidsearch_core
