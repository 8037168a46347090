#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string storage_root;
  std::string collection_name;
  std::string output_root;

  // Encoder service
  std::string encoder_url;
  std::string encoder_model;
  int embedding_dimension;
  long encoder_timeout_seconds;

  // Scene segmentation and sampling
  std::vector<double> scene_thresholds;
  int min_scene_length;
  int samples_per_scene;
  bool clamp_samples_to_scene;
  bool deduplicate_samples;

  // Store
  std::string duplicate_policy;
  int store_busy_retries;

  // Search
  int default_top_k;
  int default_image_top_k;

  std::vector<std::string> video_extensions;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.storage_root = json_config.value("storage_root", std::string("./vidsearch_db"));
      config.collection_name = json_config.value("collection_name", std::string("video_embeddings"));
      config.output_root = json_config.value("output_root", std::string("matched_imgs"));

      config.encoder_url = json_config.value("encoder_url", std::string("http://localhost:8000"));
      config.encoder_model =
          json_config.value("encoder_model", std::string("openai/clip-vit-base-patch32"));
      config.embedding_dimension = json_config.value("embedding_dimension", 512);
      config.encoder_timeout_seconds = json_config.value("encoder_timeout_seconds", 30L);

      config.scene_thresholds =
          json_config.value("scene_thresholds", std::vector<double>{15.0, 10.0, 5.0, 2.0});
      config.min_scene_length = json_config.value("min_scene_length", 15);
      config.samples_per_scene = json_config.value("samples_per_scene", 3);
      config.clamp_samples_to_scene = json_config.value("clamp_samples_to_scene", true);
      config.deduplicate_samples = json_config.value("deduplicate_samples", true);

      config.duplicate_policy = json_config.value("duplicate_policy", std::string("upsert"));
      config.store_busy_retries = json_config.value("store_busy_retries", 3);

      config.default_top_k = json_config.value("default_top_k", 5);
      config.default_image_top_k = json_config.value("default_image_top_k", 10);

      config.video_extensions = json_config.value(
          "video_extensions",
          std::vector<std::string>{".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv", ".webm"});
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (storage_root.empty()) {
      throw std::runtime_error("storage_root cannot be empty");
    }
    if (collection_name.empty()) {
      throw std::runtime_error("collection_name cannot be empty");
    }
    if (output_root.empty()) {
      throw std::runtime_error("output_root cannot be empty");
    }
    if (encoder_url.empty()) {
      throw std::runtime_error("encoder_url cannot be empty");
    }
    if (encoder_model.empty()) {
      throw std::runtime_error("encoder_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (encoder_timeout_seconds <= 0) {
      throw std::runtime_error("encoder_timeout_seconds must be greater than 0");
    }
    if (scene_thresholds.empty()) {
      throw std::runtime_error("scene_thresholds cannot be empty");
    }
    for (double threshold : scene_thresholds) {
      if (threshold <= 0.0) {
        throw std::runtime_error("scene_thresholds must all be positive");
      }
    }
    if (min_scene_length < 1) {
      throw std::runtime_error("min_scene_length must be at least 1");
    }
    if (samples_per_scene < 1) {
      throw std::runtime_error("samples_per_scene must be at least 1");
    }
    if (duplicate_policy != "upsert" && duplicate_policy != "reject") {
      throw std::runtime_error("duplicate_policy must be \"upsert\" or \"reject\"");
    }
    if (store_busy_retries < 0) {
      throw std::runtime_error("store_busy_retries cannot be negative");
    }
    if (default_top_k < 1 || default_image_top_k < 1) {
      throw std::runtime_error("default_top_k and default_image_top_k must be at least 1");
    }
    if (video_extensions.empty()) {
      throw std::runtime_error("video_extensions cannot be empty");
    }
  }
};
