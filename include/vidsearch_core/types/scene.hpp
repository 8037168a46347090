#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace vidsearch_core {

// Half-open frame range [start_frame, end_frame)
struct SceneBoundary {
  int64_t start_frame = 0;
  int64_t end_frame = 0;

  int64_t length() const {
    return end_frame >= start_frame ? end_frame - start_frame : start_frame - end_frame;
  }
};

inline bool operator==(const SceneBoundary &lhs, const SceneBoundary &rhs) {
  return lhs.start_frame == rhs.start_frame && lhs.end_frame == rhs.end_frame;
}

using SampleSet = std::vector<int64_t>;

struct Segmentation {
  std::vector<SceneBoundary> scenes;
  // Threshold that produced the scenes; empty when the whole-video fallback was used
  std::optional<double> threshold;
  bool used_fallback = false;
  int64_t total_frames = 0;
};

}  // namespace vidsearch_core
