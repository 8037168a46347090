#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "vidsearch_cli/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/vidsearch_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.storage_root, "./vidsearch_db");
  EXPECT_EQ(cfg.collection_name, "video_embeddings");
  EXPECT_EQ(cfg.output_root, "matched_imgs");
  EXPECT_EQ(cfg.encoder_url, "http://localhost:8000");
  EXPECT_EQ(cfg.encoder_model, "openai/clip-vit-base-patch32");
  EXPECT_EQ(cfg.embedding_dimension, 512);
  EXPECT_EQ(cfg.encoder_timeout_seconds, 30);
  EXPECT_EQ(cfg.scene_thresholds, (std::vector<double>{15.0, 10.0, 5.0, 2.0}));
  EXPECT_EQ(cfg.min_scene_length, 15);
  EXPECT_EQ(cfg.samples_per_scene, 3);
  EXPECT_TRUE(cfg.clamp_samples_to_scene);
  EXPECT_TRUE(cfg.deduplicate_samples);
  EXPECT_EQ(cfg.duplicate_policy, "upsert");
  EXPECT_EQ(cfg.store_busy_retries, 3);
  EXPECT_EQ(cfg.default_top_k, 5);
  EXPECT_EQ(cfg.default_image_top_k, 10);
  EXPECT_EQ(cfg.video_extensions.size(), 7u);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"storage_root", "/data/index"},
      {"collection_name", "lectures"},
      {"embedding_dimension", 768},
      {"scene_thresholds", {20.0, 8.0}},
      {"samples_per_scene", 5},
      {"deduplicate_samples", false},
      {"duplicate_policy", "reject"}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.storage_root, "/data/index");
  EXPECT_EQ(cfg.collection_name, "lectures");
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_EQ(cfg.scene_thresholds, (std::vector<double>{20.0, 8.0}));
  EXPECT_EQ(cfg.samples_per_scene, 5);
  EXPECT_FALSE(cfg.deduplicate_samples);
  EXPECT_EQ(cfg.duplicate_policy, "reject");
}

TEST(ConfigTest, ValidationErrors) {
  EXPECT_THROW(Config::from_json({{"storage_root", ""}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"embedding_dimension", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"scene_thresholds", nlohmann::json::array()}}),
               std::runtime_error);
  EXPECT_THROW(Config::from_json({{"scene_thresholds", {10.0, -2.0}}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"samples_per_scene", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"duplicate_policy", "merge"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"default_top_k", 0}}), std::runtime_error);
}

TEST(ConfigTest, WrongTypeIsReported) {
  EXPECT_THROW(Config::from_json({{"samples_per_scene", "three"}}), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
  const std::string contents = R"({
    "storage_root": "./idx",
    "encoder_url": "http://encoder:9000",
    "min_scene_length": 30
  })";
  std::string path = write_temp_file(contents);

  Config cfg = Config::from_file(path);
  EXPECT_EQ(cfg.storage_root, "./idx");
  EXPECT_EQ(cfg.encoder_url, "http://encoder:9000");
  EXPECT_EQ(cfg.min_scene_length, 30);
  EXPECT_EQ(cfg.collection_name, "video_embeddings");

  remove_file(path);
}

TEST(ConfigTest, FromFileErrors) {
  EXPECT_THROW(Config::from_file("/tmp/does_not_exist_vidsearch.json"), std::runtime_error);

  std::string path = write_temp_file("{ not json");
  EXPECT_THROW(Config::from_file(path), std::runtime_error);
  remove_file(path);
}
