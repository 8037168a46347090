#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "vidsearch_core/db/frame_store.hpp"
#include "vidsearch_core/encoder/embedding_extractor.hpp"
#include "vidsearch_core/result.hpp"
#include "vidsearch_core/video/video_source.hpp"

namespace vidsearch_services {

struct SearchReport {
  std::string query;
  // Ascending cosine distance, as returned by the store
  vidsearch_core::QueryResult hits;
  std::filesystem::path output_dir;
  std::vector<std::filesystem::path> saved_images;
  // One entry per hit whose frame could not be re-read or written
  std::vector<vidsearch_core::Failure> frame_failures;
};

// Replaces spaces and / \ : * ? " < > | with '_'; an empty or dot-only name becomes underscores
std::string sanitize_query(const std::string &query);

// "{rank:02d}_{id}_similarity_{similarity:.3f}.jpg"
std::string artifact_file_name(int rank, const std::string &frame_id, float similarity);

class SearchService {
 public:
  SearchService(std::shared_ptr<vidsearch_core::FrameStore> frame_store,
                std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor,
                std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory,
                std::filesystem::path output_root);

  // Natural-language search over indexed frames. With persist_images the matched frames are
  // written under <output_root>/<sanitized query>/.
  vidsearch_core::Result<SearchReport> search_by_text(const std::string &query,
                                                      int k,
                                                      bool persist_images);

 private:
  void persist_hits(SearchReport &report);

  std::shared_ptr<vidsearch_core::FrameStore> frame_store_;
  std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor_;
  std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory_;
  std::filesystem::path output_root_;
};

}  // namespace vidsearch_services
