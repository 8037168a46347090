#include "vidsearch_core/encoder/embedding_extractor.hpp"

#include <cmath>
#include <stdexcept>

namespace vidsearch_core {

EmbeddingExtractor::EmbeddingExtractor(std::shared_ptr<EmbeddingEncoder> encoder, int dimension)
    : encoder_(std::move(encoder)), dimension_(dimension) {
  if (!encoder_) {
    throw std::invalid_argument("EmbeddingExtractor requires an encoder");
  }
  if (dimension_ <= 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
}

bool EmbeddingExtractor::l2_normalize(Embedding &vector) {
  double norm = 0.0;
  for (float value : vector) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);
  if (norm == 0.0 || !std::isfinite(norm)) {
    return false;
  }
  for (float &value : vector) {
    value = static_cast<float>(value / norm);
  }
  return true;
}

Result<Embedding> EmbeddingExtractor::finish(Embedding raw, const std::string &context) const {
  if (raw.size() != static_cast<size_t>(dimension_)) {
    return Result<Embedding>::failure(ErrorKind::EncoderUnavailable,
                                      "Encoder returned " + std::to_string(raw.size()) +
                                          " dimensions, expected " + std::to_string(dimension_),
                                      context);
  }
  if (!l2_normalize(raw)) {
    return Result<Embedding>::failure(ErrorKind::EncoderUnavailable,
                                      "Encoder returned a zero or non-finite vector", context);
  }
  return Result<Embedding>::success(std::move(raw));
}

Result<Embedding> EmbeddingExtractor::image_embedding(const cv::Mat &image) {
  if (image.empty()) {
    return Result<Embedding>::failure(ErrorKind::DecodeFailure, "Cannot embed an empty image");
  }
  try {
    return finish(encoder_->encode_image(image), "image");
  } catch (const EncoderError &e) {
    return Result<Embedding>::failure(ErrorKind::EncoderUnavailable, e.what(), "image");
  }
}

Result<Embedding> EmbeddingExtractor::text_embedding(const std::string &text) {
  try {
    return finish(encoder_->encode_text(text), text);
  } catch (const EncoderError &e) {
    return Result<Embedding>::failure(ErrorKind::EncoderUnavailable, e.what(), text);
  }
}

Result<Embedding> EmbeddingExtractor::frame_embedding(VideoSource &source, int64_t frame_number) {
  cv::Mat frame;
  if (!source.read_frame(frame_number, frame)) {
    return Result<Embedding>::failure(ErrorKind::DecodeFailure,
                                      "Failed to read frame " + std::to_string(frame_number),
                                      source.path());
  }
  return image_embedding(frame);
}

}  // namespace vidsearch_core
