#include "vidsearch_core/scene/scene_segmenter.hpp"

#include <iostream>
#include <stdexcept>

namespace vidsearch_core {

SceneSegmenter::SceneSegmenter(SegmenterOptions options)
    : options_(std::move(options)), detector_(options_.max_width) {
  if (options_.thresholds.empty()) {
    throw std::invalid_argument("Scene segmenter needs at least one threshold");
  }
  for (double threshold : options_.thresholds) {
    if (threshold <= 0.0) {
      throw std::invalid_argument("Scene thresholds must be positive, got " +
                                  std::to_string(threshold));
    }
  }
  if (options_.min_scene_length < 1) {
    options_.min_scene_length = 1;
  }
}

std::vector<SceneBoundary> SceneSegmenter::scenes_from_cuts(const std::vector<int64_t> &cuts,
                                                            int64_t total_frames) {
  std::vector<SceneBoundary> scenes;
  if (cuts.empty()) {
    return scenes;
  }
  int64_t start = 0;
  for (int64_t cut : cuts) {
    scenes.push_back({start, cut});
    start = cut;
  }
  scenes.push_back({start, total_frames});
  return scenes;
}

Segmentation SceneSegmenter::segment_scores(const std::vector<double> &scores) const {
  Segmentation segmentation;
  segmentation.total_frames = static_cast<int64_t>(scores.size());

  for (double threshold : options_.thresholds) {
    auto cuts = ContentDetector::find_cuts(scores, threshold, options_.min_scene_length);
    auto scenes = scenes_from_cuts(cuts, segmentation.total_frames);
    std::cout << "Scene detection with threshold " << threshold << ": Found " << scenes.size()
              << " scenes" << std::endl;
    if (!scenes.empty()) {
      segmentation.scenes = std::move(scenes);
      segmentation.threshold = threshold;
      return segmentation;
    }
  }

  std::cout << "No scenes detected with any threshold - treating entire video as one scene"
            << std::endl;
  segmentation.scenes.push_back({0, segmentation.total_frames});
  segmentation.used_fallback = true;
  return segmentation;
}

Result<Segmentation> SceneSegmenter::segment(VideoSource &source) const {
  auto scores = detector_.compute_scores(source);
  if (!scores) {
    return Result<Segmentation>::failure(scores.error());
  }

  if (scores.value().empty()) {
    if (source.frame_count() > 0) {
      return Result<Segmentation>::failure(ErrorKind::DecodeFailure,
                                           "No frame of the video could be decoded",
                                           source.path());
    }
    return Result<Segmentation>::failure(ErrorKind::EmptyInput, "Video has no frames",
                                         source.path());
  }

  return Result<Segmentation>::success(segment_scores(scores.value()));
}

}  // namespace vidsearch_core
