#include "vidsearch_services/search_service.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace vidsearch_services {

using vidsearch_core::ErrorKind;
using vidsearch_core::Failure;
using vidsearch_core::Result;

std::string sanitize_query(const std::string &query) {
  static const std::string unsafe = " /\\:*?\"<>|";
  std::string sanitized = query;
  for (char &c : sanitized) {
    if (unsafe.find(c) != std::string::npos) {
      c = '_';
    }
  }
  // "", "." and ".." would resolve to output_root or its parent
  if (sanitized.find_first_not_of('.') == std::string::npos) {
    sanitized.assign(std::max<size_t>(sanitized.size(), 1), '_');
  }
  return sanitized;
}

std::string artifact_file_name(int rank, const std::string &frame_id, float similarity) {
  char rank_buf[16];
  char sim_buf[32];
  std::snprintf(rank_buf, sizeof(rank_buf), "%02d", rank);
  std::snprintf(sim_buf, sizeof(sim_buf), "%.3f", similarity);
  return std::string(rank_buf) + "_" + frame_id + "_similarity_" + sim_buf + ".jpg";
}

SearchService::SearchService(std::shared_ptr<vidsearch_core::FrameStore> frame_store,
                             std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor,
                             std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory,
                             std::filesystem::path output_root)
    : frame_store_(std::move(frame_store)),
      extractor_(std::move(extractor)),
      video_factory_(std::move(video_factory)),
      output_root_(std::move(output_root)) {}

Result<SearchReport> SearchService::search_by_text(const std::string &query,
                                                   int k,
                                                   bool persist_images) {
  std::cout << "Searching for: '" << query << "'" << std::endl;

  auto embedding = extractor_->text_embedding(query);
  if (!embedding) {
    return Result<SearchReport>::failure(embedding.error());
  }

  auto hits = frame_store_->query_by_vector(embedding.value(), k);
  if (!hits) {
    return Result<SearchReport>::failure(hits.error());
  }

  SearchReport report;
  report.query = query;
  report.hits = std::move(hits.value());

  if (persist_images && !report.hits.empty()) {
    report.output_dir = output_root_ / sanitize_query(query);
    persist_hits(report);
  }
  return Result<SearchReport>::success(std::move(report));
}

void SearchService::persist_hits(SearchReport &report) {
  std::error_code ec;
  std::filesystem::create_directories(report.output_dir, ec);
  if (ec) {
    report.frame_failures.push_back(Failure{ErrorKind::StoreWriteFailure,
                                            "Cannot create output directory: " + ec.message(),
                                            report.output_dir.string()});
    return;
  }

  for (size_t i = 0; i < report.hits.size(); ++i) {
    const auto &hit = report.hits[i];
    const int rank = static_cast<int>(i) + 1;

    cv::Mat frame;
    try {
      auto source = video_factory_->open(hit.metadata.video_path);
      if (!source->read_frame(hit.metadata.frame_sample, frame) || frame.empty()) {
        report.frame_failures.push_back(
            Failure{ErrorKind::DecodeFailure,
                    "Cannot read frame " + std::to_string(hit.metadata.frame_sample) + " of " +
                        hit.metadata.video_path,
                    hit.id});
        continue;
      }
    } catch (const vidsearch_core::VideoSourceError &e) {
      report.frame_failures.push_back(Failure{ErrorKind::InputNotFound, e.what(), hit.id});
      continue;
    }

    const auto path =
        report.output_dir / artifact_file_name(rank, hit.id, hit.similarity().value_or(0.0f));
    bool written = false;
    try {
      written = cv::imwrite(path.string(), frame);
    } catch (const cv::Exception &e) {
      std::cerr << "Warning: " << e.what() << std::endl;
    }
    if (!written) {
      report.frame_failures.push_back(
          Failure{ErrorKind::StoreWriteFailure, "Cannot write " + path.string(), hit.id});
      continue;
    }
    report.saved_images.push_back(path);
  }

  std::cout << "Saved " << report.saved_images.size() << " matched frames to "
            << report.output_dir.string() << std::endl;
}

}  // namespace vidsearch_services
