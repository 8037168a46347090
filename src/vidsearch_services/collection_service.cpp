#include "vidsearch_services/collection_service.hpp"

#include <limits>
#include <map>
#include <set>
#include <utility>

namespace vidsearch_services {

using vidsearch_core::ErrorKind;
using vidsearch_core::Result;

CollectionService::CollectionService(std::shared_ptr<vidsearch_core::FrameStore> frame_store)
    : frame_store_(std::move(frame_store)) {}

Result<std::vector<VideoSummary>> CollectionService::list_videos() {
  auto all = frame_store_->query_by_metadata({}, std::numeric_limits<int>::max());
  if (!all) {
    return Result<std::vector<VideoSummary>>::failure(all.error());
  }

  // Keyed by (name, path) so that two files with the same basename stay apart
  std::map<std::pair<std::string, std::string>, std::set<int64_t>> scenes;
  std::map<std::pair<std::string, std::string>, size_t> frames;
  for (const auto &hit : all.value()) {
    auto key = std::make_pair(hit.metadata.video_name, hit.metadata.video_path);
    scenes[key].insert(hit.metadata.scene_idx);
    frames[key]++;
  }

  std::vector<VideoSummary> videos;
  for (const auto &[key, count] : frames) {
    VideoSummary summary;
    summary.video_name = key.first;
    summary.video_path = key.second;
    summary.frame_count = count;
    summary.scene_count = scenes[key].size();
    videos.push_back(std::move(summary));
  }
  return Result<std::vector<VideoSummary>>::success(std::move(videos));
}

Result<std::vector<SceneSummary>> CollectionService::list_scenes(
    const std::optional<std::string> &video_name) {
  vidsearch_core::MetadataFilter filter;
  if (video_name) {
    filter.push_back({vidsearch_core::MetadataField::VideoName, *video_name});
  }
  auto frames = frame_store_->query_by_metadata(filter, std::numeric_limits<int>::max());
  if (!frames) {
    return Result<std::vector<SceneSummary>>::failure(frames.error());
  }

  // Rows arrive ordered by video_name, scene_idx, frame_idx
  std::vector<SceneSummary> scenes;
  for (const auto &hit : frames.value()) {
    if (scenes.empty() || scenes.back().video_name != hit.metadata.video_name ||
        scenes.back().scene_idx != hit.metadata.scene_idx) {
      SceneSummary scene;
      scene.video_name = hit.metadata.video_name;
      scene.scene_idx = hit.metadata.scene_idx;
      scenes.push_back(std::move(scene));
    }
    scenes.back().frame_ids.push_back(hit.id);
  }
  return Result<std::vector<SceneSummary>>::success(std::move(scenes));
}

Result<vidsearch_core::QueryResult> CollectionService::similar_to_frame(const std::string &frame_id,
                                                                        int k) {
  auto records = frame_store_->get({frame_id});
  if (!records) {
    return Result<vidsearch_core::QueryResult>::failure(records.error());
  }
  if (records.value().empty()) {
    return Result<vidsearch_core::QueryResult>::failure(ErrorKind::EmptyInput,
                                                        "Frame ID not found", frame_id);
  }
  return frame_store_->query_by_vector(records.value().front().embedding, k);
}

}  // namespace vidsearch_services
