#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace vidsearch_core {

class EncoderError : public std::exception {
 public:
  explicit EncoderError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
Vision-language encoder mapping images and text into one embedding space. Implementations
throw EncoderError when the model cannot produce an embedding.
*/
class EmbeddingEncoder {
 public:
  virtual ~EmbeddingEncoder() = default;

  // image is a BGR frame as decoded by OpenCV
  virtual std::vector<float> encode_image(const cv::Mat &image) = 0;
  virtual std::vector<float> encode_text(const std::string &text) = 0;

  virtual bool is_available() = 0;
};

}  // namespace vidsearch_core
