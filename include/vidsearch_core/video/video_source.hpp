#pragma once

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace vidsearch_core {

class VideoSourceError : public std::exception {
 public:
  explicit VideoSourceError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
A decodable video addressed by absolute frame number. Implementations own their decoder
handle and release it on destruction.
*/
class VideoSource {
 public:
  virtual ~VideoSource() = default;

  virtual const std::string &path() const = 0;

  // Frame count reported by the container; may be 0 or approximate
  virtual int64_t frame_count() const = 0;
  virtual double fps() const = 0;

  // Sequential decode from the current position. Returns false at end of stream.
  virtual bool read_next(cv::Mat &frame) = 0;

  // Seek to frame_number and decode that frame. Returns false if it cannot be read.
  virtual bool read_frame(int64_t frame_number, cv::Mat &frame) = 0;

  // Reposition at frame 0 for another sequential pass
  virtual bool rewind() = 0;
};

using VideoSourcePtr = std::unique_ptr<VideoSource>;

class OpenCvVideoSource : public VideoSource {
 public:
  // Throws VideoSourceError if the container cannot be opened
  explicit OpenCvVideoSource(const std::string &path);
  ~OpenCvVideoSource() override;

  OpenCvVideoSource(const OpenCvVideoSource &) = delete;
  OpenCvVideoSource &operator=(const OpenCvVideoSource &) = delete;

  const std::string &path() const override {
    return path_;
  }
  int64_t frame_count() const override {
    return frame_count_;
  }
  double fps() const override {
    return fps_;
  }

  bool read_next(cv::Mat &frame) override;
  bool read_frame(int64_t frame_number, cv::Mat &frame) override;
  bool rewind() override;

 private:
  std::string path_;
  cv::VideoCapture capture_;
  int64_t frame_count_ = 0;
  double fps_ = 0.0;
};

/*
Opens videos by path. The pipeline only talks to this factory so tests can substitute
synthetic sources.
*/
class VideoSourceFactory {
 public:
  virtual ~VideoSourceFactory() = default;

  // Throws VideoSourceError if the video cannot be opened
  virtual VideoSourcePtr open(const std::filesystem::path &video_path) const;
};

}  // namespace vidsearch_core
