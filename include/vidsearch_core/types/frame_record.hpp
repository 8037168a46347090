#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vidsearch_core {

struct FrameMetadata {
  std::string video_path;
  std::string video_name;
  int64_t scene_idx = 0;
  int64_t frame_idx = 0;
  int64_t frame_sample = 0;
};

inline bool operator==(const FrameMetadata &lhs, const FrameMetadata &rhs) {
  return lhs.video_path == rhs.video_path && lhs.video_name == rhs.video_name &&
         lhs.scene_idx == rhs.scene_idx && lhs.frame_idx == rhs.frame_idx &&
         lhs.frame_sample == rhs.frame_sample;
}

struct FrameRecord {
  std::string id;
  std::vector<float> embedding;
  FrameMetadata metadata;
};

struct QueryHit {
  std::string id;
  // Cosine distance; empty for hits produced by a metadata-only query
  std::optional<float> distance;
  FrameMetadata metadata;

  std::optional<float> similarity() const {
    if (!distance) {
      return std::nullopt;
    }
    return 1.0f - *distance;
  }
};

using QueryResult = std::vector<QueryHit>;

struct CollectionInfo {
  std::string collection_name;
  size_t total_embeddings = 0;
  std::string db_path;
  int dimension = 0;
};

}  // namespace vidsearch_core
