#include "vidsearch_services/indexing_service.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "vidsearch_core/frame_identity.hpp"

namespace vidsearch_services {

using vidsearch_core::ErrorKind;
using vidsearch_core::Failure;
using vidsearch_core::FrameRecord;
using vidsearch_core::Result;

IndexingService::IndexingService(std::shared_ptr<vidsearch_core::FrameStore> frame_store,
                                 std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor,
                                 std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory,
                                 vidsearch_core::SceneSegmenter segmenter,
                                 vidsearch_core::FrameSampler sampler)
    : frame_store_(std::move(frame_store)),
      extractor_(std::move(extractor)),
      video_factory_(std::move(video_factory)),
      segmenter_(std::move(segmenter)),
      sampler_(std::move(sampler)) {}

VideoIndexResult IndexingService::index_video(const std::filesystem::path &video_path) {
  const std::string path_str = video_path.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(video_path, ec)) {
    return VideoIndexResult::failure_response(
        path_str, Failure{ErrorKind::InputNotFound, "Video file not found", path_str});
  }

  std::cout << "Processing video: " << video_path.filename().string() << std::endl;
  std::cout << "Full path: " << path_str << std::endl;

  // Decoder and conversion errors (cv::Exception among them) stay inside this video
  try {
    return run_pipeline(video_path);
  } catch (const std::exception &e) {
    std::cerr << "Error processing " << path_str << ": " << e.what() << std::endl;
    return VideoIndexResult::failure_response(
        path_str, Failure{ErrorKind::DecodeFailure, e.what(), path_str});
  }
}

VideoIndexResult IndexingService::run_pipeline(const std::filesystem::path &video_path) {
  const std::string path_str = video_path.string();

  std::vector<FrameRecord> records;
  {
    // The decoder handle lives only for this block
    // Open failures throw VideoSourceError, reported by index_video as DecodeFailure
    vidsearch_core::VideoSourcePtr source = video_factory_->open(video_path);

    auto extracted = extract_records(*source);
    if (!extracted) {
      return VideoIndexResult::failure_response(path_str, extracted.error());
    }
    records = std::move(extracted.value());
  }

  if (records.empty()) {
    return VideoIndexResult::failure_response(
        path_str,
        Failure{ErrorKind::EmptyInput, "No embeddings generated from video", path_str});
  }
  std::cout << "Generated " << records.size() << " embeddings" << std::endl;

  auto inserted = frame_store_->insert(records);
  if (!inserted) {
    return VideoIndexResult::failure_response(path_str, inserted.error());
  }

  auto info = frame_store_->info();
  if (!info) {
    return VideoIndexResult::failure_response(path_str, info.error());
  }

  std::cout << "Successfully processed video and saved " << records.size() << " embeddings"
            << std::endl;
  std::cout << "Collection now has " << info.value().total_embeddings << " total embeddings"
            << std::endl;
  return VideoIndexResult::success_response(path_str, records.size(), info.value(),
                                            inserted.value().replaced_from_other_video);
}

Result<std::vector<FrameRecord>> IndexingService::extract_records(
    vidsearch_core::VideoSource &source) {
  auto segmentation = segmenter_.segment(source);
  if (!segmentation) {
    return Result<std::vector<FrameRecord>>::failure(segmentation.error());
  }
  const auto &scenes = segmentation.value().scenes;
  if (scenes.empty()) {
    return Result<std::vector<FrameRecord>>::failure(ErrorKind::NoScenesDetected,
                                                     "Segmentation produced no scenes",
                                                     source.path());
  }

  std::vector<FrameRecord> records;
  for (size_t scene_idx = 0; scene_idx < scenes.size(); ++scene_idx) {
    const auto samples = sampler_.sample(scenes[scene_idx]);
    for (size_t frame_idx = 0; frame_idx < samples.size(); ++frame_idx) {
      const int64_t frame_sample = samples[frame_idx];
      auto embedding = extractor_->frame_embedding(source, frame_sample);
      if (!embedding) {
        if (embedding.error().kind == ErrorKind::DecodeFailure) {
          std::cerr << "Warning: Skipping frame " << frame_sample << " of " << source.path()
                    << ": " << embedding.error().message << std::endl;
          continue;
        }
        return Result<std::vector<FrameRecord>>::failure(embedding.error());
      }

      FrameRecord record;
      record.id = vidsearch_core::build_frame_id(scene_idx, frame_idx, frame_sample);
      record.embedding = std::move(embedding.value());
      record.metadata =
          vidsearch_core::build_frame_metadata(source.path(), scene_idx, frame_idx, frame_sample);
      records.push_back(std::move(record));
    }
  }
  return Result<std::vector<FrameRecord>>::success(std::move(records));
}

BatchSummary IndexingService::index_videos(const std::vector<std::filesystem::path> &video_paths) {
  BatchSummary summary;
  const size_t total = video_paths.size();

  std::cout << "Processing " << total << " videos..." << std::endl;
  std::cout << std::string(50, '=') << std::endl;

  for (size_t i = 0; i < total; ++i) {
    const std::string path_str = video_paths[i].string();
    if (cancelled_) {
      summary.results.push_back(VideoIndexResult::failure_response(
          path_str, Failure{ErrorKind::Cancelled, "Batch cancelled before this video", path_str}));
      summary.failed++;
      continue;
    }

    std::cout << "\n[" << (i + 1) << "/" << total
              << "] Processing: " << video_paths[i].filename().string() << std::endl;
    std::cout << std::string(30, '-') << std::endl;

    VideoIndexResult result = index_video(video_paths[i]);
    if (result.success) {
      std::cout << "Success: " << result.embeddings_count << " embeddings saved" << std::endl;
      summary.succeeded++;
      summary.total_embeddings += result.embeddings_count;
      summary.replaced_from_other_videos += result.replaced_from_other_videos;
      summary.collection_info = result.collection_info;
    } else {
      std::cout << "Failed: " << result.error->describe() << std::endl;
      summary.failed++;
    }
    summary.results.push_back(std::move(result));
  }
  cancelled_ = false;

  std::cout << "\n" << std::string(50, '=') << std::endl;
  std::cout << "SUMMARY:" << std::endl;
  std::cout << "   Videos processed: " << summary.succeeded << "/" << total << std::endl;
  std::cout << "   Total embeddings: " << summary.total_embeddings << std::endl;
  if (summary.replaced_from_other_videos > 0) {
    std::cout << "   Replaced from other videos: " << summary.replaced_from_other_videos
              << std::endl;
  }
  if (summary.collection_info) {
    std::cout << "   Collection total: " << summary.collection_info->total_embeddings
              << " embeddings" << std::endl;
  }
  return summary;
}

std::vector<std::filesystem::path> IndexingService::videos_in_directory(
    const std::filesystem::path &dir, const std::vector<std::string> &extensions) {
  std::vector<std::filesystem::path> videos;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    std::cerr << "Directory not found: " << dir.string() << std::endl;
    return videos;
  }

  std::filesystem::directory_iterator it(dir, ec);
  const std::filesystem::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto &entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
      videos.push_back(entry.path());
    }
  }
  if (ec) {
    std::cerr << "Warning: stopped listing " << dir.string() << ": " << ec.message()
              << std::endl;
  }
  std::sort(videos.begin(), videos.end());
  return videos;
}

}  // namespace vidsearch_services
