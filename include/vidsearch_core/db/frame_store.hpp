#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "vidsearch_core/db/database_manager.hpp"
#include "vidsearch_core/db/write_transaction.hpp"
#include "vidsearch_core/result.hpp"
#include "vidsearch_core/types/frame_record.hpp"

namespace vidsearch_core {

class FrameStoreError : public std::exception {
 public:
  explicit FrameStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// What an insert does with an id that is already stored
enum class DuplicatePolicy { Upsert, Reject };
std::string to_string(DuplicatePolicy policy);
DuplicatePolicy duplicate_policy_from_string(const std::string &str);

enum class MetadataField { VideoPath, VideoName, SceneIdx, FrameIdx, FrameSample };
std::string to_string(MetadataField field);
std::optional<MetadataField> metadata_field_from_string(const std::string &str);

struct MetadataPredicate {
  MetadataField field;
  std::variant<std::string, int64_t> value;
};

// Conjunction of equality predicates
using MetadataFilter = std::vector<MetadataPredicate>;

struct StoreOptions {
  std::string collection_name = "video_embeddings";
  int dimension = 512;
  DuplicatePolicy duplicate_policy = DuplicatePolicy::Upsert;
  // Extra attempts for a write that hit SQLITE_BUSY / SQLITE_LOCKED
  int busy_retries = 3;
};

struct InsertSummary {
  size_t inserted = 0;
  size_t replaced = 0;
  // Subset of replaced whose stored row belonged to a different video_path
  size_t replaced_from_other_video = 0;
};

/*
A named collection of frame embeddings. Rows live in SQLite; a FAISS inner-product index over
the unit vectors is rebuilt from the table when the store opens and kept in step with every
committed write. Distances are cosine distances (1 - inner product).

Only the constructor throws (FrameStoreError); every other entry point reports store errors
as StoreWriteFailure / StoreQueryFailure.
*/
class FrameStore {
 public:
  FrameStore(std::shared_ptr<DatabaseManager> db_manager, StoreOptions options = {});
  ~FrameStore();

  FrameStore(const FrameStore &) = delete;
  FrameStore &operator=(const FrameStore &) = delete;
  FrameStore(FrameStore &&) = delete;
  FrameStore &operator=(FrameStore &&) = delete;

  // Empty input fails with EmptyInput, meaning nothing was attempted
  Result<InsertSummary> insert(const std::vector<FrameRecord> &records);

  Result<QueryResult> query_by_vector(const std::vector<float> &query_vector, int k);
  Result<QueryResult> query_by_metadata(const MetadataFilter &filter, int k);

  // Records for the given ids in request order; unknown ids are skipped
  Result<std::vector<FrameRecord>> get(const std::vector<std::string> &ids);
  Result<std::vector<FrameRecord>> get_all();

  // Returns the number of records actually removed
  Result<size_t> remove(const std::vector<std::string> &ids);
  Result<size_t> clear();

  Result<size_t> count();
  Result<CollectionInfo> info();

  const StoreOptions &options() const {
    return options_;
  }

  // Reloads the FAISS index from the table
  void rebuild_index();

 private:
  using SqlValue = std::variant<std::string, sqlite3_int64>;

  struct PendingWrite {
    InsertSummary summary;
    std::map<sqlite3_int64, std::vector<float>> vectors;
    std::vector<sqlite3_int64> replaced_rows;
    // Set when the Reject policy stopped the batch
    std::optional<std::string> rejected_id;
  };

  struct StoredRow {
    sqlite3_int64 row_id;
    FrameRecord record;
  };

  sqlite::database &db_;
  std::shared_ptr<DatabaseManager> db_manager_;
  StoreOptions options_;
  sqlite3_int64 collection_id_ = 0;
  std::unique_ptr<faiss::IndexIDMap2> index_;

  void open_collection();
  std::unique_ptr<faiss::IndexIDMap2> create_base_index() const;
  std::optional<std::string> validate_record(const FrameRecord &record) const;
  PendingWrite write_batch(WriteTransaction &tx, const std::vector<FrameRecord> &records,
                           std::string &current_id);
  void apply_to_index(const PendingWrite &pending);
  void remove_from_index(const std::vector<sqlite3_int64> &rows);
  std::vector<StoredRow> select_rows(const std::string &where_clause,
                                     const std::vector<SqlValue> &binds,
                                     bool with_embeddings,
                                     const std::string &suffix = "");

  static std::vector<char> to_blob(const std::vector<float> &vector);
  static std::string current_time_string();
  static std::string placeholders(size_t count);
  static std::string row_id_list(const std::vector<sqlite3_int64> &rows);
};

}  // namespace vidsearch_core
