#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <vector>

#include "vidsearch_core/result.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_core {

/*
Content-change detector. Each frame is scored by the mean absolute difference of its HSV
channels against the previous frame (averaged over H, S and V, 8-bit scale). Frames are
downscaled to at most max_width pixels wide before conversion.
*/
class ContentDetector {
 public:
  explicit ContentDetector(int max_width = 256);

  // One sequential decode pass. scores[i] compares frame i with frame i-1; scores[0] == 0.
  // Fails with DecodeFailure if the source cannot be rewound.
  Result<std::vector<double>> compute_scores(VideoSource &source) const;

  // Score between two frames already converted to HSV with equal size
  static double content_delta(const cv::Mat &previous_hsv, const cv::Mat &current_hsv);

  // Frame numbers where a new scene starts. A cut needs score >= threshold and at least
  // min_scene_length frames since the previous cut (or since frame 0).
  static std::vector<int64_t> find_cuts(const std::vector<double> &scores,
                                        double threshold,
                                        int64_t min_scene_length);

 private:
  cv::Mat to_hsv(const cv::Mat &frame) const;

  int max_width_;
};

}  // namespace vidsearch_core
