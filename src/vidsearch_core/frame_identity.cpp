#include "vidsearch_core/frame_identity.hpp"

#include <filesystem>

namespace vidsearch_core {

std::string build_frame_id(int64_t scene_idx, int64_t frame_idx, int64_t frame_sample) {
  return "scene_" + std::to_string(scene_idx) + "_frame_" + std::to_string(frame_idx) +
         "_sample_" + std::to_string(frame_sample);
}

FrameMetadata build_frame_metadata(const std::string &video_path,
                                   int64_t scene_idx,
                                   int64_t frame_idx,
                                   int64_t frame_sample) {
  FrameMetadata metadata;
  metadata.video_path = video_path;
  metadata.video_name = std::filesystem::path(video_path).filename().string();
  metadata.scene_idx = scene_idx;
  metadata.frame_idx = frame_idx;
  metadata.frame_sample = frame_sample;
  return metadata;
}

}  // namespace vidsearch_core
