#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "vidsearch_core/encoder/embedding_encoder.hpp"
#include "vidsearch_core/result.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_core {

using Embedding = std::vector<float>;

/*
Adapter between the pipeline and the encoder. Every vector it returns has exactly
dimension() components and unit L2 norm. Encoder exceptions, wrong sizes and zero-norm
vectors come back as EncoderUnavailable; undecodable frames as DecodeFailure.
*/
class EmbeddingExtractor {
 public:
  EmbeddingExtractor(std::shared_ptr<EmbeddingEncoder> encoder, int dimension);

  Result<Embedding> image_embedding(const cv::Mat &image);
  Result<Embedding> text_embedding(const std::string &text);

  // Seeks to frame_number in source, decodes it and embeds the image
  Result<Embedding> frame_embedding(VideoSource &source, int64_t frame_number);

  int dimension() const {
    return dimension_;
  }

  // Divides by the Euclidean norm in place; returns false for an all-zero vector
  static bool l2_normalize(Embedding &vector);

 private:
  Result<Embedding> finish(Embedding raw, const std::string &context) const;

  std::shared_ptr<EmbeddingEncoder> encoder_;
  int dimension_;
};

}  // namespace vidsearch_core
