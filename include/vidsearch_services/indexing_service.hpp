#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vidsearch_core/db/frame_store.hpp"
#include "vidsearch_core/encoder/embedding_extractor.hpp"
#include "vidsearch_core/result.hpp"
#include "vidsearch_core/scene/frame_sampler.hpp"
#include "vidsearch_core/scene/scene_segmenter.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_services {

struct VideoIndexResult {
  bool success;
  std::string video_path;
  size_t embeddings_count;
  std::optional<vidsearch_core::Failure> error;
  std::optional<vidsearch_core::CollectionInfo> collection_info;
  // Stored frames of other videos that this video's ids replaced
  size_t replaced_from_other_videos = 0;

  static VideoIndexResult success_response(const std::string &path,
                                           size_t embeddings_count,
                                           vidsearch_core::CollectionInfo info,
                                           size_t replaced_from_other_videos = 0) {
    return {true, path, embeddings_count, std::nullopt, std::move(info),
            replaced_from_other_videos};
  }

  static VideoIndexResult failure_response(const std::string &path,
                                           vidsearch_core::Failure failure) {
    return {false, path, 0, std::move(failure), std::nullopt, 0};
  }
};

struct BatchSummary {
  std::vector<VideoIndexResult> results;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t total_embeddings = 0;
  // Ids shared across videos overwrite each other, so the collection can hold fewer than
  // total_embeddings
  size_t replaced_from_other_videos = 0;
  // Collection state after the last successful video
  std::optional<vidsearch_core::CollectionInfo> collection_info;
};

/*
Drives the indexing pipeline for one or many videos: open, segment, sample, embed, store.
A failed video is reported in its result and never stops the batch.
*/
class IndexingService {
 public:
  IndexingService(std::shared_ptr<vidsearch_core::FrameStore> frame_store,
                  std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor,
                  std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory,
                  vidsearch_core::SceneSegmenter segmenter,
                  vidsearch_core::FrameSampler sampler);

  virtual ~IndexingService() = default;

  VideoIndexResult index_video(const std::filesystem::path &video_path);
  BatchSummary index_videos(const std::vector<std::filesystem::path> &video_paths);

  // Stops a running batch before its next video; the flag clears when the batch returns
  void cancel() {
    cancelled_ = true;
  }
  bool is_cancelled() const {
    return cancelled_;
  }

  // Sorted regular files in dir whose lowercase extension is listed
  static std::vector<std::filesystem::path> videos_in_directory(
      const std::filesystem::path &dir, const std::vector<std::string> &extensions);

 private:
  VideoIndexResult run_pipeline(const std::filesystem::path &video_path);
  vidsearch_core::Result<std::vector<vidsearch_core::FrameRecord>> extract_records(
      vidsearch_core::VideoSource &source);

  std::shared_ptr<vidsearch_core::FrameStore> frame_store_;
  std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor_;
  std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory_;
  vidsearch_core::SceneSegmenter segmenter_;
  vidsearch_core::FrameSampler sampler_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace vidsearch_services
