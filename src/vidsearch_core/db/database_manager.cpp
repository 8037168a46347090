#include "vidsearch_core/db/database_manager.hpp"

#include <stdexcept>

#include "vidsearch_core/db/sqlite_error_utils.hpp"

namespace vidsearch_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &storage_root)
    : db_path_(storage_root / DB_FILE_NAME) {
  std::error_code ec;
  std::filesystem::create_directories(storage_root, ec);
  if (ec) {
    throw std::runtime_error("Failed to create storage root " + storage_root.string() + ": " +
                             ec.message());
  }

  try {
    db_ = std::make_unique<sqlite::database>(db_path_.string());
    *db_ << "PRAGMA foreign_keys = ON;";
    *db_ << "PRAGMA journal_mode = WAL;";
    setup_schema();
  } catch (const sqlite::sqlite_exception &e) {
    throw std::runtime_error(describe_db_error("open " + db_path_.string(), e));
  }
}

void DatabaseManager::setup_schema() {
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS collections (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          name TEXT UNIQUE NOT NULL,
          dimension INTEGER NOT NULL,
          description TEXT,
          created_at TEXT NOT NULL
      )
    )";

  *db_ << R"(
      CREATE TABLE IF NOT EXISTS frames (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          collection_id INTEGER NOT NULL,
          frame_id TEXT NOT NULL,
          video_path TEXT NOT NULL,
          video_name TEXT NOT NULL,
          scene_idx INTEGER NOT NULL,
          frame_idx INTEGER NOT NULL,
          frame_sample INTEGER NOT NULL,
          embedding BLOB NOT NULL,
          updated_at TEXT NOT NULL,
          UNIQUE (collection_id, frame_id),
          FOREIGN KEY (collection_id) REFERENCES collections(id) ON DELETE CASCADE
      )
    )";

  *db_ << R"(
      CREATE INDEX IF NOT EXISTS idx_frames_collection_video
      ON frames(collection_id, video_name, scene_idx, frame_idx)
    )";
}

}  // namespace vidsearch_core
