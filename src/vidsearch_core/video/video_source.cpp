#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_core {

OpenCvVideoSource::OpenCvVideoSource(const std::string &path) : path_(path) {
  capture_.open(path_);
  if (!capture_.isOpened()) {
    throw VideoSourceError("Could not open video file: " + path_);
  }
  frame_count_ = static_cast<int64_t>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
  if (frame_count_ < 0) {
    frame_count_ = 0;
  }
  fps_ = capture_.get(cv::CAP_PROP_FPS);
}

OpenCvVideoSource::~OpenCvVideoSource() {
  if (capture_.isOpened()) {
    capture_.release();
  }
}

bool OpenCvVideoSource::read_next(cv::Mat &frame) {
  if (!capture_.isOpened()) {
    return false;
  }
  return capture_.read(frame) && !frame.empty();
}

bool OpenCvVideoSource::read_frame(int64_t frame_number, cv::Mat &frame) {
  if (!capture_.isOpened() || frame_number < 0) {
    return false;
  }
  capture_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(frame_number));
  return capture_.read(frame) && !frame.empty();
}

bool OpenCvVideoSource::rewind() {
  if (!capture_.isOpened()) {
    return false;
  }
  return capture_.set(cv::CAP_PROP_POS_FRAMES, 0.0);
}

VideoSourcePtr VideoSourceFactory::open(const std::filesystem::path &video_path) const {
  return std::make_unique<OpenCvVideoSource>(video_path.string());
}

}  // namespace vidsearch_core
