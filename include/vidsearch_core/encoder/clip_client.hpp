#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "vidsearch_core/encoder/embedding_encoder.hpp"

namespace vidsearch_core {

/*
HTTP client for a CLIP-style embedding service:
  POST {url}/embed/image?model=...   body: JPEG bytes
  POST {url}/embed/text              body: {"model": ..., "text": ...}
  GET  {url}/health
Responses carry "embedding": [...] or "embeddings": [[...], ...].
*/
class ClipClient : public EmbeddingEncoder {
 public:
  ClipClient(const std::string &service_url, const std::string &model, long timeout_seconds = 30);
  ~ClipClient() override;

  // Disable copy constructor and assignment
  ClipClient(const ClipClient &) = delete;
  ClipClient &operator=(const ClipClient &) = delete;

  std::vector<float> encode_image(const cv::Mat &image) override;
  std::vector<float> encode_text(const std::string &text) override;
  bool is_available() override;

  // Extracts the first embedding vector from a service response
  static std::vector<float> parse_embedding_response(const nlohmann::json &response);

 private:
  std::string service_url_;
  std::string model_;
  long timeout_seconds_;
  CURL *curl_handle_;

  std::string post(const std::string &endpoint,
                   const std::string &body,
                   const std::string &content_type);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  std::string build_url(const std::string &endpoint) const;
};

}  // namespace vidsearch_core
