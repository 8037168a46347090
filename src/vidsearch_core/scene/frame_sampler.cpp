#include "vidsearch_core/scene/frame_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace vidsearch_core {

FrameSampler::FrameSampler(SamplerOptions options) : options_(options) {
  if (options_.samples_per_scene < 1) {
    throw std::invalid_argument("samples_per_scene must be at least 1, got " +
                                std::to_string(options_.samples_per_scene));
  }
}

int64_t FrameSampler::stride_for(int64_t scene_length, int count) {
  // std::nearbyint uses the default rounding mode, round-half-to-even
  double exact = static_cast<double>(scene_length) / static_cast<double>(count);
  return static_cast<int64_t>(std::nearbyint(exact));
}

SampleSet FrameSampler::sample(const SceneBoundary &scene) const {
  return sample(scene, options_.samples_per_scene);
}

SampleSet FrameSampler::sample(const SceneBoundary &scene, int count) const {
  if (count < 1) {
    throw std::invalid_argument("Sample count must be at least 1, got " + std::to_string(count));
  }

  const int64_t stride = stride_for(scene.length(), count);
  const int64_t last_frame =
      scene.end_frame > scene.start_frame ? scene.end_frame - 1 : scene.start_frame;

  SampleSet samples;
  samples.reserve(static_cast<size_t>(count));
  for (int k = 0; k < count; ++k) {
    int64_t frame = scene.start_frame + stride * k;
    if (options_.clamp_to_scene_end) {
      frame = std::min(frame, last_frame);
    }
    if (options_.deduplicate && !samples.empty() && samples.back() == frame) {
      continue;
    }
    samples.push_back(frame);
  }
  return samples;
}

}  // namespace vidsearch_core
