#pragma once

#include <cstdint>
#include <vector>

#include "vidsearch_core/result.hpp"
#include "vidsearch_core/scene/content_detector.hpp"
#include "vidsearch_core/types/scene.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_core {

struct SegmenterOptions {
  // Tried in order, strict to loose; the first threshold that yields a scene wins
  std::vector<double> thresholds{15.0, 10.0, 5.0, 2.0};
  int64_t min_scene_length = 15;
  int max_width = 256;
};

class SceneSegmenter {
 public:
  // Throws std::invalid_argument for an empty threshold list or non-positive values
  explicit SceneSegmenter(SegmenterOptions options = {});

  /*
  Splits the video into scenes. When no threshold finds a cut the whole video becomes one
  scene [0, total_frames). Fails with EmptyInput for a video without frames and with
  DecodeFailure when no frame can be decoded.
  */
  Result<Segmentation> segment(VideoSource &source) const;

  // Same strategy over precomputed per-frame scores
  Segmentation segment_scores(const std::vector<double> &scores) const;

  static std::vector<SceneBoundary> scenes_from_cuts(const std::vector<int64_t> &cuts,
                                                     int64_t total_frames);

  const SegmenterOptions &options() const {
    return options_;
  }

 private:
  SegmenterOptions options_;
  ContentDetector detector_;
};

}  // namespace vidsearch_core
