#pragma once

#include <gmock/gmock.h>

#include <opencv2/core.hpp>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "vidsearch_core/encoder/embedding_encoder.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_tests {

/**
 * Mock class for the embedding service to use in tests
 */
class MockEmbeddingEncoder : public vidsearch_core::EmbeddingEncoder {
 public:
  MockEmbeddingEncoder() = default;

  MOCK_METHOD(std::vector<float>, encode_image, (const cv::Mat& image), (override));
  MOCK_METHOD(std::vector<float>, encode_text, (const std::string& text), (override));
  MOCK_METHOD(bool, is_available, (), (override));
};

/**
 * In-memory video made of synthetic frames. Frames listed in unreadable_frames fail on
 * random access, as a corrupt frame in a real container would. A faulty source throws
 * cv::Exception from sequential decoding.
 */
class FakeVideoSource : public vidsearch_core::VideoSource {
 public:
  FakeVideoSource(std::string path,
                  std::vector<cv::Mat> frames,
                  std::set<int64_t> unreadable = {},
                  bool faulty = false)
      : path_(std::move(path)),
        frames_(std::move(frames)),
        unreadable_(std::move(unreadable)),
        faulty_(faulty) {}

  const std::string& path() const override {
    return path_;
  }
  int64_t frame_count() const override {
    return static_cast<int64_t>(frames_.size());
  }
  double fps() const override {
    return 30.0;
  }

  bool read_next(cv::Mat& frame) override {
    if (faulty_) {
      throw cv::Exception(cv::Error::StsUnsupportedFormat, "unsupported frame layout",
                          "FakeVideoSource::read_next", __FILE__, __LINE__);
    }
    if (position_ >= frames_.size()) {
      return false;
    }
    frame = frames_[position_++];
    return true;
  }

  bool read_frame(int64_t frame_number, cv::Mat& frame) override {
    if (frame_number < 0 || frame_number >= frame_count() || unreadable_.count(frame_number)) {
      return false;
    }
    frame = frames_[static_cast<size_t>(frame_number)];
    position_ = static_cast<size_t>(frame_number) + 1;
    return true;
  }

  bool rewind() override {
    position_ = 0;
    return true;
  }

 private:
  std::string path_;
  std::vector<cv::Mat> frames_;
  std::set<int64_t> unreadable_;
  bool faulty_;
  size_t position_ = 0;
};

/**
 * Serves registered synthetic videos by path; anything else fails to open.
 */
class FakeVideoSourceFactory : public vidsearch_core::VideoSourceFactory {
 public:
  void add_video(const std::string& path,
                 std::vector<cv::Mat> frames,
                 std::set<int64_t> unreadable = {}) {
    videos_[path] = {std::move(frames), std::move(unreadable), false};
  }

  // Opens fine, then throws on the first decoded frame
  void add_faulty_video(const std::string& path, std::vector<cv::Mat> frames) {
    videos_[path] = {std::move(frames), {}, true};
  }

  vidsearch_core::VideoSourcePtr open(const std::filesystem::path& video_path) const override {
    auto it = videos_.find(video_path.string());
    if (it == videos_.end()) {
      throw vidsearch_core::VideoSourceError("Could not open video: " + video_path.string());
    }
    open_count_++;
    return std::make_unique<FakeVideoSource>(it->first, it->second.frames, it->second.unreadable,
                                             it->second.faulty);
  }

  int open_count() const {
    return open_count_;
  }

 private:
  struct Entry {
    std::vector<cv::Mat> frames;
    std::set<int64_t> unreadable;
    bool faulty;
  };
  std::map<std::string, Entry> videos_;
  mutable int open_count_ = 0;
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

// Solid BGR frames
inline std::vector<cv::Mat> create_solid_frames(int count,
                                                const cv::Scalar& bgr,
                                                int width = 64,
                                                int height = 48) {
  std::vector<cv::Mat> frames;
  frames.reserve(count);
  for (int i = 0; i < count; ++i) {
    frames.emplace_back(height, width, CV_8UC3, bgr);
  }
  return frames;
}

// Consecutive solid-colour segments, one per (length, colour) pair
inline std::vector<cv::Mat> create_segmented_frames(
    const std::vector<std::pair<int, cv::Scalar>>& segments) {
  std::vector<cv::Mat> frames;
  for (const auto& [length, colour] : segments) {
    auto part = create_solid_frames(length, colour);
    frames.insert(frames.end(), part.begin(), part.end());
  }
  return frames;
}

// Deterministic embedding derived from the mean colour of an image, so distinct scenes map to
// distinct directions
inline std::vector<float> embedding_from_image(const cv::Mat& image, size_t dimensions) {
  cv::Scalar mean = cv::mean(image);
  std::vector<float> embedding(dimensions, 0.01f);
  embedding[0] += static_cast<float>(mean[0]);
  embedding[1 % dimensions] += static_cast<float>(mean[1]);
  embedding[2 % dimensions] += static_cast<float>(mean[2]);
  return embedding;
}

// One-hot embedding along axis
inline std::vector<float> create_axis_embedding(size_t axis, size_t dimensions, float weight = 1.0f) {
  std::vector<float> embedding(dimensions, 0.0f);
  embedding[axis % dimensions] = weight;
  return embedding;
}

}  // namespace MockUtilities

}  // namespace vidsearch_tests
