#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vidsearch_core/db/frame_store.hpp"
#include "vidsearch_core/result.hpp"

namespace vidsearch_services {

struct VideoSummary {
  std::string video_name;
  std::string video_path;
  size_t frame_count = 0;
  size_t scene_count = 0;
};

struct SceneSummary {
  std::string video_name;
  int64_t scene_idx = 0;
  std::vector<std::string> frame_ids;
};

// Read-side views over the stored collection
class CollectionService {
 public:
  explicit CollectionService(std::shared_ptr<vidsearch_core::FrameStore> frame_store);

  // One entry per video path, ordered by video name
  vidsearch_core::Result<std::vector<VideoSummary>> list_videos();

  // Frames grouped by (video, scene); restricted to one video name when given
  vidsearch_core::Result<std::vector<SceneSummary>> list_scenes(
      const std::optional<std::string> &video_name = std::nullopt);

  // Nearest neighbours of a stored frame. The frame itself is the first hit.
  vidsearch_core::Result<vidsearch_core::QueryResult> similar_to_frame(const std::string &frame_id,
                                                                       int k);

 private:
  std::shared_ptr<vidsearch_core::FrameStore> frame_store_;
};

}  // namespace vidsearch_services
