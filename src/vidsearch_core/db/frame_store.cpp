#include "vidsearch_core/db/frame_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "vidsearch_core/db/sqlite_error_utils.hpp"

namespace vidsearch_core {

namespace {

constexpr const char *COLLECTION_DESCRIPTION = "CLIP embeddings for video frames";

std::string column_for(MetadataField field) {
  switch (field) {
    case MetadataField::VideoPath: return "video_path";
    case MetadataField::VideoName: return "video_name";
    case MetadataField::SceneIdx: return "scene_idx";
    case MetadataField::FrameIdx: return "frame_idx";
    case MetadataField::FrameSample: return "frame_sample";
  }
  throw std::invalid_argument("Unknown metadata field");
}

}  // namespace

std::string to_string(DuplicatePolicy policy) {
  switch (policy) {
    case DuplicatePolicy::Upsert: return "upsert";
    case DuplicatePolicy::Reject: return "reject";
  }
  return "upsert";
}

DuplicatePolicy duplicate_policy_from_string(const std::string &str) {
  if (str == "upsert") return DuplicatePolicy::Upsert;
  if (str == "reject") return DuplicatePolicy::Reject;
  throw std::invalid_argument("Unknown duplicate policy: " + str);
}

std::string to_string(MetadataField field) {
  return column_for(field);
}

std::optional<MetadataField> metadata_field_from_string(const std::string &str) {
  if (str == "video_path") return MetadataField::VideoPath;
  if (str == "video_name") return MetadataField::VideoName;
  if (str == "scene_idx") return MetadataField::SceneIdx;
  if (str == "frame_idx") return MetadataField::FrameIdx;
  if (str == "frame_sample") return MetadataField::FrameSample;
  return std::nullopt;
}

FrameStore::FrameStore(std::shared_ptr<DatabaseManager> db_manager, StoreOptions options)
    : db_(db_manager->database()), db_manager_(std::move(db_manager)), options_(std::move(options)) {
  if (options_.dimension <= 0) {
    throw FrameStoreError("Embedding dimension must be positive");
  }
  if (options_.collection_name.empty()) {
    throw FrameStoreError("Collection name must not be empty");
  }
  open_collection();
}

FrameStore::~FrameStore() = default;

void FrameStore::open_collection() {
  bool created = false;
  try {
    std::optional<sqlite3_int64> existing_id;
    int existing_dimension = 0;
    db_ << "SELECT id, dimension FROM collections WHERE name = ?" << options_.collection_name >>
        [&](sqlite3_int64 id, int dimension) {
          existing_id = id;
          existing_dimension = dimension;
        };

    if (existing_id) {
      if (existing_dimension != options_.dimension) {
        throw FrameStoreError("Collection '" + options_.collection_name + "' stores " +
                              std::to_string(existing_dimension) +
                              "-dimensional embeddings, configured dimension is " +
                              std::to_string(options_.dimension));
      }
      collection_id_ = *existing_id;
    } else {
      db_ << "INSERT INTO collections (name, dimension, description, created_at) VALUES (?,?,?,?)"
          << options_.collection_name << options_.dimension << COLLECTION_DESCRIPTION
          << current_time_string();
      collection_id_ = db_.last_insert_rowid();
      created = true;
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw FrameStoreError(describe_db_error("open_collection", e));
  }

  rebuild_index();

  if (created) {
    std::cout << "Created new collection '" << options_.collection_name << "'" << std::endl;
  } else {
    std::cout << "Found existing collection '" << options_.collection_name << "' with "
              << index_->ntotal << " embeddings" << std::endl;
  }
}

std::unique_ptr<faiss::IndexIDMap2> FrameStore::create_base_index() const {
  auto index = std::make_unique<faiss::IndexIDMap2>(new faiss::IndexFlatIP(options_.dimension));
  index->own_fields = true;
  return index;
}

void FrameStore::rebuild_index() {
  auto index = create_base_index();
  const size_t expected_bytes = static_cast<size_t>(options_.dimension) * sizeof(float);

  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  try {
    db_ << "SELECT id, embedding FROM frames WHERE collection_id = ?" << collection_id_ >>
        [&](sqlite3_int64 id, std::vector<char> blob) {
          if (blob.size() == expected_bytes) {
            faiss_ids.push_back(id);
            const float *vec_ptr = reinterpret_cast<const float *>(blob.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + options_.dimension);
          } else {
            std::cerr << "Warning: Skipping row " << id
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << expected_bytes << " bytes, got " << blob.size() << " bytes." << std::endl;
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw FrameStoreError(describe_db_error("rebuild_index", e));
  }

  try {
    if (!faiss_ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                          faiss_ids.data());
    }
  } catch (const faiss::FaissException &e) {
    throw FrameStoreError(std::string("Failed to rebuild FAISS index: ") + e.what());
  }
  index_ = std::move(index);
}

std::optional<std::string> FrameStore::validate_record(const FrameRecord &record) const {
  if (record.id.empty()) {
    return std::string("Frame record has an empty id");
  }
  if (record.embedding.size() != static_cast<size_t>(options_.dimension)) {
    return "Embedding for '" + record.id + "' has dimension " +
           std::to_string(record.embedding.size()) + ", expected " +
           std::to_string(options_.dimension);
  }
  return std::nullopt;
}

Result<InsertSummary> FrameStore::insert(const std::vector<FrameRecord> &records) {
  if (records.empty()) {
    std::cout << "No embeddings to save - skipping" << std::endl;
    return Result<InsertSummary>::failure(ErrorKind::EmptyInput, "No frame records to insert",
                                          options_.collection_name);
  }

  for (const auto &record : records) {
    if (auto problem = validate_record(record)) {
      return Result<InsertSummary>::failure(ErrorKind::StoreWriteFailure, *problem, record.id);
    }
  }

  if (options_.duplicate_policy == DuplicatePolicy::Reject) {
    std::set<std::string> seen;
    for (const auto &record : records) {
      if (!seen.insert(record.id).second) {
        return Result<InsertSummary>::failure(ErrorKind::StoreWriteFailure,
                                              "Duplicate frame id within batch", record.id);
      }
    }
  }

  PendingWrite pending;
  std::string current_id;
  try {
    pending = run_write_transaction(db_, options_.busy_retries, "insert",
                                    [&](WriteTransaction &tx) {
                                      return write_batch(tx, records, current_id);
                                    });
  } catch (const sqlite::sqlite_exception &e) {
    return Result<InsertSummary>::failure(
        to_failure(ErrorKind::StoreWriteFailure, "insert", e, current_id));
  }

  if (pending.rejected_id) {
    return Result<InsertSummary>::failure(ErrorKind::StoreWriteFailure,
                                          "Frame id already stored in collection '" +
                                              options_.collection_name + "'",
                                          *pending.rejected_id);
  }

  try {
    apply_to_index(pending);
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: FAISS update failed (" << e.what() << "), rebuilding index"
              << std::endl;
    try {
      rebuild_index();
    } catch (const FrameStoreError &rebuild_error) {
      return Result<InsertSummary>::failure(ErrorKind::StoreWriteFailure, rebuild_error.what(),
                                            options_.collection_name);
    }
  }

  std::cout << "Saved " << records.size() << " embeddings to collection '"
            << options_.collection_name << "' (" << pending.summary.inserted << " new, "
            << pending.summary.replaced << " replaced)" << std::endl;
  if (pending.summary.replaced_from_other_video > 0) {
    std::cerr << "Warning: " << pending.summary.replaced_from_other_video
              << " of the replaced embeddings belonged to another video" << std::endl;
  }
  return Result<InsertSummary>::success(pending.summary);
}

FrameStore::PendingWrite FrameStore::write_batch(WriteTransaction &tx,
                                                 const std::vector<FrameRecord> &records,
                                                 std::string &current_id) {
  PendingWrite pending;
  std::set<sqlite3_int64> inserted_rows;
  const std::string now = current_time_string();

  for (const auto &record : records) {
    current_id = record.id;
    const FrameMetadata &meta = record.metadata;

    std::optional<sqlite3_int64> existing_row;
    std::string existing_path;
    db_ << "SELECT id, video_path FROM frames WHERE collection_id = ? AND frame_id = ?"
        << collection_id_ << record.id >>
        [&](sqlite3_int64 id, std::string video_path) {
          existing_row = id;
          existing_path = std::move(video_path);
        };

    if (existing_row) {
      if (options_.duplicate_policy == DuplicatePolicy::Reject) {
        tx.rollback();
        pending.rejected_id = record.id;
        return pending;
      }
      if (existing_path != meta.video_path && inserted_rows.count(*existing_row) == 0) {
        std::cerr << "Warning: '" << record.id << "' from " << meta.video_path
                  << " replaces the embedding stored for " << existing_path << std::endl;
        pending.summary.replaced_from_other_video++;
      }
      db_ << "UPDATE frames SET video_path=?, video_name=?, scene_idx=?, frame_idx=?, "
             "frame_sample=?, embedding=?, updated_at=? WHERE id=?"
          << meta.video_path << meta.video_name << static_cast<sqlite3_int64>(meta.scene_idx)
          << static_cast<sqlite3_int64>(meta.frame_idx)
          << static_cast<sqlite3_int64>(meta.frame_sample) << to_blob(record.embedding) << now
          << *existing_row;
      if (inserted_rows.count(*existing_row) == 0) {
        pending.replaced_rows.push_back(*existing_row);
      }
      pending.summary.replaced++;
      pending.vectors[*existing_row] = record.embedding;
    } else {
      db_ << "INSERT INTO frames (collection_id, frame_id, video_path, video_name, scene_idx, "
             "frame_idx, frame_sample, embedding, updated_at) VALUES (?,?,?,?,?,?,?,?,?)"
          << collection_id_ << record.id << meta.video_path << meta.video_name
          << static_cast<sqlite3_int64>(meta.scene_idx)
          << static_cast<sqlite3_int64>(meta.frame_idx)
          << static_cast<sqlite3_int64>(meta.frame_sample) << to_blob(record.embedding) << now;
      const sqlite3_int64 row_id = db_.last_insert_rowid();
      inserted_rows.insert(row_id);
      pending.summary.inserted++;
      pending.vectors[row_id] = record.embedding;
    }
  }
  current_id.clear();
  return pending;
}

void FrameStore::apply_to_index(const PendingWrite &pending) {
  remove_from_index(pending.replaced_rows);
  if (pending.vectors.empty()) {
    return;
  }

  std::vector<faiss::idx_t> ids;
  std::vector<float> flat;
  ids.reserve(pending.vectors.size());
  flat.reserve(pending.vectors.size() * options_.dimension);
  for (const auto &[row_id, vector] : pending.vectors) {
    ids.push_back(row_id);
    flat.insert(flat.end(), vector.begin(), vector.end());
  }
  index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
}

void FrameStore::remove_from_index(const std::vector<sqlite3_int64> &rows) {
  if (rows.empty()) {
    return;
  }
  std::vector<faiss::idx_t> ids(rows.begin(), rows.end());
  faiss::IDSelectorBatch selector(ids.size(), ids.data());
  index_->remove_ids(selector);
}

Result<QueryResult> FrameStore::query_by_vector(const std::vector<float> &query_vector, int k) {
  if (query_vector.size() != static_cast<size_t>(options_.dimension)) {
    return Result<QueryResult>::failure(
        ErrorKind::StoreQueryFailure,
        "Query vector has dimension " + std::to_string(query_vector.size()) + ", expected " +
            std::to_string(options_.dimension),
        options_.collection_name);
  }

  const int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  if (actual_k <= 0) {
    return Result<QueryResult>::success({});
  }

  try {
    std::vector<float> scores(actual_k);
    std::vector<faiss::idx_t> labels(actual_k);
    index_->search(1, query_vector.data(), actual_k, scores.data(), labels.data());

    std::vector<sqlite3_int64> label_rows;
    label_rows.reserve(actual_k);
    for (int i = 0; i < actual_k; ++i) {
      if (labels[i] != -1) {
        label_rows.push_back(labels[i]);
      }
    }
    if (label_rows.empty()) {
      return Result<QueryResult>::success({});
    }

    std::unordered_map<sqlite3_int64, FrameRecord> rows_by_id;
    for (auto &row : select_rows("id IN (" + row_id_list(label_rows) + ")", {}, false)) {
      rows_by_id.emplace(row.row_id, std::move(row.record));
    }

    // Assemble in FAISS rank order
    QueryResult hits;
    hits.reserve(label_rows.size());
    for (int i = 0; i < actual_k; ++i) {
      if (labels[i] == -1) {
        continue;
      }
      auto it = rows_by_id.find(labels[i]);
      if (it == rows_by_id.end()) {
        std::cerr << "Warning: Index row " << labels[i] << " has no stored metadata" << std::endl;
        continue;
      }
      QueryHit hit;
      hit.id = it->second.id;
      hit.distance = 1.0f - scores[i];
      hit.metadata = it->second.metadata;
      hits.push_back(std::move(hit));
    }
    return Result<QueryResult>::success(std::move(hits));
  } catch (const sqlite::sqlite_exception &e) {
    return Result<QueryResult>::failure(to_failure(ErrorKind::StoreQueryFailure,
                                                   "query_by_vector", e,
                                                   options_.collection_name));
  } catch (const faiss::FaissException &e) {
    return Result<QueryResult>::failure(ErrorKind::StoreQueryFailure,
                                        std::string("FAISS search failed: ") + e.what(),
                                        options_.collection_name);
  }
}

Result<QueryResult> FrameStore::query_by_metadata(const MetadataFilter &filter, int k) {
  if (k <= 0) {
    return Result<QueryResult>::success({});
  }

  std::string where_clause;
  std::vector<SqlValue> binds;
  for (const auto &predicate : filter) {
    if (!where_clause.empty()) {
      where_clause += " AND ";
    }
    where_clause += column_for(predicate.field) + " = ?";
    if (std::holds_alternative<std::string>(predicate.value)) {
      binds.emplace_back(std::get<std::string>(predicate.value));
    } else {
      binds.emplace_back(static_cast<sqlite3_int64>(std::get<int64_t>(predicate.value)));
    }
  }
  binds.emplace_back(static_cast<sqlite3_int64>(k));

  try {
    QueryResult hits;
    for (auto &row : select_rows(where_clause, binds, false,
                                 "ORDER BY video_name, scene_idx, frame_idx LIMIT ?")) {
      QueryHit hit;
      hit.id = row.record.id;
      hit.metadata = std::move(row.record.metadata);
      hits.push_back(std::move(hit));
    }
    return Result<QueryResult>::success(std::move(hits));
  } catch (const sqlite::sqlite_exception &e) {
    return Result<QueryResult>::failure(to_failure(ErrorKind::StoreQueryFailure,
                                                   "query_by_metadata", e,
                                                   options_.collection_name));
  }
}

Result<std::vector<FrameRecord>> FrameStore::get(const std::vector<std::string> &ids) {
  if (ids.empty()) {
    return Result<std::vector<FrameRecord>>::success({});
  }

  try {
    std::vector<SqlValue> binds(ids.begin(), ids.end());
    std::unordered_map<std::string, FrameRecord> by_frame_id;
    for (auto &row : select_rows("frame_id IN (" + placeholders(ids.size()) + ")", binds, true)) {
      by_frame_id.emplace(row.record.id, std::move(row.record));
    }

    std::vector<FrameRecord> records;
    records.reserve(by_frame_id.size());
    for (const auto &id : ids) {
      auto it = by_frame_id.find(id);
      if (it != by_frame_id.end()) {
        records.push_back(it->second);
      }
    }
    return Result<std::vector<FrameRecord>>::success(std::move(records));
  } catch (const sqlite::sqlite_exception &e) {
    return Result<std::vector<FrameRecord>>::failure(
        to_failure(ErrorKind::StoreQueryFailure, "get", e, options_.collection_name));
  }
}

Result<std::vector<FrameRecord>> FrameStore::get_all() {
  try {
    std::vector<FrameRecord> records;
    for (auto &row : select_rows("", {}, true, "ORDER BY id")) {
      records.push_back(std::move(row.record));
    }
    return Result<std::vector<FrameRecord>>::success(std::move(records));
  } catch (const sqlite::sqlite_exception &e) {
    return Result<std::vector<FrameRecord>>::failure(
        to_failure(ErrorKind::StoreQueryFailure, "get_all", e, options_.collection_name));
  }
}

Result<size_t> FrameStore::remove(const std::vector<std::string> &ids) {
  if (ids.empty()) {
    return Result<size_t>::success(0);
  }

  std::vector<sqlite3_int64> rows;
  try {
    const std::vector<SqlValue> binds(ids.begin(), ids.end());
    rows = run_write_transaction(db_, options_.busy_retries, "remove", [&](WriteTransaction &) {
      std::vector<sqlite3_int64> matched;
      for (const auto &row : select_rows("frame_id IN (" + placeholders(ids.size()) + ")", binds,
                                         false)) {
        matched.push_back(row.row_id);
      }
      if (!matched.empty()) {
        db_ << "DELETE FROM frames WHERE id IN (" + row_id_list(matched) + ")";
      }
      return matched;
    });
  } catch (const sqlite::sqlite_exception &e) {
    return Result<size_t>::failure(
        to_failure(ErrorKind::StoreWriteFailure, "remove", e, options_.collection_name));
  }

  try {
    remove_from_index(rows);
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: FAISS removal failed (" << e.what() << "), rebuilding index"
              << std::endl;
    try {
      rebuild_index();
    } catch (const FrameStoreError &rebuild_error) {
      return Result<size_t>::failure(ErrorKind::StoreWriteFailure, rebuild_error.what(),
                                     options_.collection_name);
    }
  }

  std::cout << "Deleted " << rows.size() << " embeddings from collection '"
            << options_.collection_name << "'" << std::endl;
  return Result<size_t>::success(rows.size());
}

Result<size_t> FrameStore::clear() {
  size_t removed = 0;
  try {
    removed = run_write_transaction(db_, options_.busy_retries, "clear", [&](WriteTransaction &) {
      size_t stored = 0;
      db_ << "SELECT COUNT(*) FROM frames WHERE collection_id = ?" << collection_id_ >>
          [&](sqlite3_int64 n) { stored = static_cast<size_t>(n); };
      db_ << "DELETE FROM frames WHERE collection_id = ?" << collection_id_;
      return stored;
    });
  } catch (const sqlite::sqlite_exception &e) {
    return Result<size_t>::failure(
        to_failure(ErrorKind::StoreWriteFailure, "clear", e, options_.collection_name));
  }

  index_->reset();
  std::cout << "Cleared " << removed << " embeddings from collection '"
            << options_.collection_name << "'" << std::endl;
  return Result<size_t>::success(removed);
}

Result<size_t> FrameStore::count() {
  try {
    size_t total = 0;
    db_ << "SELECT COUNT(*) FROM frames WHERE collection_id = ?" << collection_id_ >>
        [&](sqlite3_int64 n) { total = static_cast<size_t>(n); };
    return Result<size_t>::success(total);
  } catch (const sqlite::sqlite_exception &e) {
    return Result<size_t>::failure(
        to_failure(ErrorKind::StoreQueryFailure, "count", e, options_.collection_name));
  }
}

Result<CollectionInfo> FrameStore::info() {
  auto total = count();
  if (!total) {
    return Result<CollectionInfo>::failure(total.error());
  }
  CollectionInfo info;
  info.collection_name = options_.collection_name;
  info.total_embeddings = total.value();
  info.db_path = db_manager_->db_path().string();
  info.dimension = options_.dimension;
  return Result<CollectionInfo>::success(info);
}

std::vector<FrameStore::StoredRow> FrameStore::select_rows(const std::string &where_clause,
                                                           const std::vector<SqlValue> &binds,
                                                           bool with_embeddings,
                                                           const std::string &suffix) {
  std::string sql = "SELECT id, frame_id, video_path, video_name, scene_idx, frame_idx, "
                    "frame_sample, ";
  sql += with_embeddings ? "embedding" : "NULL";
  sql += " FROM frames WHERE collection_id = ?";
  if (!where_clause.empty()) {
    sql += " AND " + where_clause;
  }
  if (!suffix.empty()) {
    sql += " " + suffix;
  }

  auto binder = db_ << sql;
  binder << collection_id_;
  for (const auto &value : binds) {
    std::visit([&binder](const auto &v) { binder << v; }, value);
  }

  std::vector<StoredRow> rows;
  binder >> [&](sqlite3_int64 row_id, std::string frame_id, std::string video_path,
                std::string video_name, sqlite3_int64 scene_idx, sqlite3_int64 frame_idx,
                sqlite3_int64 frame_sample, std::optional<std::vector<char>> blob) {
    StoredRow row;
    row.row_id = row_id;
    row.record.id = std::move(frame_id);
    row.record.metadata.video_path = std::move(video_path);
    row.record.metadata.video_name = std::move(video_name);
    row.record.metadata.scene_idx = scene_idx;
    row.record.metadata.frame_idx = frame_idx;
    row.record.metadata.frame_sample = frame_sample;
    if (blob && !blob->empty()) {
      row.record.embedding.resize(blob->size() / sizeof(float));
      std::memcpy(row.record.embedding.data(), blob->data(),
                  row.record.embedding.size() * sizeof(float));
    }
    rows.push_back(std::move(row));
  };
  return rows;
}

std::vector<char> FrameStore::to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::string FrameStore::current_time_string() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&now), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::string FrameStore::placeholders(size_t count) {
  std::string result;
  for (size_t i = 0; i < count; ++i) {
    result += (i == 0) ? "?" : ",?";
  }
  return result;
}

std::string FrameStore::row_id_list(const std::vector<sqlite3_int64> &rows) {
  std::string result;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (i > 0) {
      result += ",";
    }
    result += std::to_string(rows[i]);
  }
  return result;
}

}  // namespace vidsearch_core
