#include "vidsearch_core/scene/content_detector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace vidsearch_core {

ContentDetector::ContentDetector(int max_width) : max_width_(std::max(16, max_width)) {}

cv::Mat ContentDetector::to_hsv(const cv::Mat &frame) const {
  cv::Mat bgr;
  if (frame.channels() == 1) {
    cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = frame;
  }

  if (bgr.cols > max_width_) {
    double scale = static_cast<double>(max_width_) / bgr.cols;
    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(), scale, scale, cv::INTER_AREA);
    bgr = resized;
  }

  cv::Mat hsv;
  cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
  return hsv;
}

double ContentDetector::content_delta(const cv::Mat &previous_hsv, const cv::Mat &current_hsv) {
  cv::Mat diff;
  cv::absdiff(previous_hsv, current_hsv, diff);
  cv::Scalar channel_means = cv::mean(diff);
  return (channel_means[0] + channel_means[1] + channel_means[2]) / 3.0;
}

Result<std::vector<double>> ContentDetector::compute_scores(VideoSource &source) const {
  if (!source.rewind()) {
    return Result<std::vector<double>>::failure(
        ErrorKind::DecodeFailure, "Could not rewind video for scene detection", source.path());
  }

  std::vector<double> scores;
  if (source.frame_count() > 0) {
    scores.reserve(static_cast<size_t>(source.frame_count()));
  }

  cv::Mat frame;
  cv::Mat previous_hsv;
  while (source.read_next(frame)) {
    cv::Mat current_hsv = to_hsv(frame);
    if (previous_hsv.empty() || previous_hsv.size() != current_hsv.size()) {
      scores.push_back(0.0);
    } else {
      scores.push_back(content_delta(previous_hsv, current_hsv));
    }
    previous_hsv = current_hsv;
  }
  return Result<std::vector<double>>::success(std::move(scores));
}

std::vector<int64_t> ContentDetector::find_cuts(const std::vector<double> &scores,
                                                double threshold,
                                                int64_t min_scene_length) {
  std::vector<int64_t> cuts;
  int64_t last_cut = 0;
  for (size_t i = 1; i < scores.size(); ++i) {
    int64_t frame_number = static_cast<int64_t>(i);
    if (scores[i] >= threshold && frame_number - last_cut >= min_scene_length) {
      cuts.push_back(frame_number);
      last_cut = frame_number;
    }
  }
  return cuts;
}

}  // namespace vidsearch_core
