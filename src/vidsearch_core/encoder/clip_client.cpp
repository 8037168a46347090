#include "vidsearch_core/encoder/clip_client.hpp"

#include <opencv2/imgcodecs.hpp>

namespace vidsearch_core {

ClipClient::ClipClient(const std::string &service_url, const std::string &model, long timeout_seconds)
    : service_url_(service_url),
      model_(model),
      timeout_seconds_(timeout_seconds),
      curl_handle_(curl_easy_init()) {
  if (!curl_handle_) {
    throw EncoderError("Failed to initialize CURL");
  }
  while (!service_url_.empty() && service_url_.back() == '/') {
    service_url_.pop_back();
  }
}

ClipClient::~ClipClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

size_t ClipClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string ClipClient::build_url(const std::string &endpoint) const {
  return service_url_ + endpoint;
}

std::string ClipClient::post(const std::string &endpoint,
                             const std::string &body,
                             const std::string &content_type) {
  std::string response_body;
  std::string url = build_url(endpoint);

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, timeout_seconds_);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
  headers = curl_slist_append(headers, "Accept: application/json");
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);

  CURLcode res = curl_easy_perform(curl_handle_);
  long response_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response_code);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    throw EncoderError("Request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
  }
  if (response_code < 200 || response_code >= 300) {
    throw EncoderError("Encoder service returned HTTP " + std::to_string(response_code) +
                       " for " + endpoint + ": " + response_body);
  }
  return response_body;
}

std::vector<float> ClipClient::parse_embedding_response(const nlohmann::json &response) {
  if (response.contains("embedding")) {
    const auto &embedding = response["embedding"];
    if (!embedding.is_array()) {
      throw EncoderError("Embedding field is not an array");
    }
    return embedding.get<std::vector<float>>();
  }

  if (!response.contains("embeddings")) {
    throw EncoderError("Response does not contain embedding field");
  }

  // Handle different embedding response formats
  const auto &embeddings = response["embeddings"];
  if (!embeddings.is_array() || embeddings.empty()) {
    throw EncoderError("Embeddings field is not a non-empty array");
  }
  if (embeddings[0].is_array()) {
    // Array of arrays - take the first embedding vector
    return embeddings[0].get<std::vector<float>>();
  }
  return embeddings.get<std::vector<float>>();
}

std::vector<float> ClipClient::encode_image(const cv::Mat &image) {
  if (image.empty()) {
    throw EncoderError("Cannot embed an empty image");
  }

  std::vector<uchar> jpeg;
  if (!cv::imencode(".jpg", image, jpeg)) {
    throw EncoderError("Failed to JPEG-encode frame for the encoder");
  }
  std::string body(jpeg.begin(), jpeg.end());

  char *escaped_model = curl_easy_escape(curl_handle_, model_.c_str(), static_cast<int>(model_.size()));
  std::string endpoint = "/embed/image?model=" + std::string(escaped_model ? escaped_model : "");
  curl_free(escaped_model);

  try {
    return parse_embedding_response(nlohmann::json::parse(post(endpoint, body, "image/jpeg")));
  } catch (const nlohmann::json::exception &e) {
    throw EncoderError("Failed to parse image embedding response: " + std::string(e.what()));
  }
}

std::vector<float> ClipClient::encode_text(const std::string &text) {
  nlohmann::json request = {{"model", model_}, {"text", text}};
  try {
    return parse_embedding_response(
        nlohmann::json::parse(post("/embed/text", request.dump(), "application/json")));
  } catch (const nlohmann::json::exception &e) {
    throw EncoderError("Failed to parse text embedding response: " + std::string(e.what()));
  }
}

bool ClipClient::is_available() {
  std::string response_body;
  std::string url = build_url("/health");

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, timeout_seconds_);

  CURLcode res = curl_easy_perform(curl_handle_);
  long response_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response_code);
  return res == CURLE_OK && response_code == 200;
}

}  // namespace vidsearch_core
