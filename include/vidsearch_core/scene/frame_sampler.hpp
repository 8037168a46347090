#pragma once

#include "vidsearch_core/types/scene.hpp"

namespace vidsearch_core {

struct SamplerOptions {
  int samples_per_scene = 3;
  // Keep samples inside the scene: anything past the last frame becomes the last frame
  bool clamp_to_scene_end = true;
  // Drop consecutive duplicates, so short scenes yield fewer samples than requested
  bool deduplicate = true;
};

/*
Picks frame numbers start + stride * k, k in [0, count), with
stride = round(scene_length / count) rounded half to even. With both options disabled the
raw stride positions are returned unchanged.
*/
class FrameSampler {
 public:
  // Throws std::invalid_argument if samples_per_scene < 1
  explicit FrameSampler(SamplerOptions options = {});

  SampleSet sample(const SceneBoundary &scene) const;
  SampleSet sample(const SceneBoundary &scene, int count) const;

  static int64_t stride_for(int64_t scene_length, int count);

  const SamplerOptions &options() const {
    return options_;
  }

 private:
  SamplerOptions options_;
};

}  // namespace vidsearch_core
