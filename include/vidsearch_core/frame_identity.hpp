#pragma once

#include <cstdint>
#include <string>

#include "vidsearch_core/types/frame_record.hpp"

namespace vidsearch_core {

// "scene_{scene_idx}_frame_{frame_idx}_sample_{frame_sample}"; the same inputs always give the
// same id, which is what makes re-indexing a video idempotent.
std::string build_frame_id(int64_t scene_idx, int64_t frame_idx, int64_t frame_sample);

FrameMetadata build_frame_metadata(const std::string &video_path,
                                   int64_t scene_idx,
                                   int64_t frame_idx,
                                   int64_t frame_sample);

}  // namespace vidsearch_core
