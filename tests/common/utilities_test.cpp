#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>

#include "vidsearch_core/frame_identity.hpp"

namespace vidsearch_tests {

std::filesystem::path TestUtilities::create_temp_storage_root() {
  static std::atomic<int> counter{0};
  auto temp_dir = std::filesystem::temp_directory_path() / "vidsearch_tests";
  std::filesystem::create_directories(temp_dir);

  // Timestamp plus a counter keeps roots unique within one run
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

  auto root = temp_dir / ("store_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
  std::filesystem::create_directories(root);
  return root;
}

void TestUtilities::cleanup_temp_storage(const std::filesystem::path& storage_root) {
  std::error_code ec;
  std::filesystem::remove_all(storage_root, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = storage_root.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::create_placeholder_file(const std::filesystem::path& dir,
                                                             const std::string& name) {
  std::filesystem::create_directories(dir);
  auto path = dir / name;
  std::ofstream(path) << "placeholder";
  return path;
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, int dimension) {
  std::vector<float> vector;
  vector.resize(dimension);

  std::hash<std::string> hasher;
  size_t seed_hash = hasher(seed_text);

  for (int i = 0; i < dimension; ++i) {
    vector[i] = static_cast<float>((seed_hash + i * 7919) % 1000) / 1000.0f + 0.001f;
  }

  return vector;
}

std::vector<float> TestUtilities::create_unit_vector(const std::string& seed_text, int dimension) {
  auto vector = create_test_vector(seed_text, dimension);
  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);
  for (float& v : vector) {
    v = static_cast<float>(v / norm);
  }
  return vector;
}

vidsearch_core::FrameRecord TestUtilities::create_test_record(const std::string& video_path,
                                                              int64_t scene_idx,
                                                              int64_t frame_idx,
                                                              int64_t frame_sample,
                                                              int dimension) {
  vidsearch_core::FrameRecord record;
  record.id = vidsearch_core::build_frame_id(scene_idx, frame_idx, frame_sample);
  record.metadata =
      vidsearch_core::build_frame_metadata(video_path, scene_idx, frame_idx, frame_sample);
  record.embedding = create_unit_vector(video_path + "/" + record.id, dimension);
  return record;
}

std::vector<vidsearch_core::FrameRecord> TestUtilities::create_test_video_records(
    const std::string& video_path, int scenes, int samples_per_scene, int dimension) {
  std::vector<vidsearch_core::FrameRecord> records;
  for (int scene = 0; scene < scenes; ++scene) {
    for (int sample = 0; sample < samples_per_scene; ++sample) {
      records.push_back(
          create_test_record(video_path, scene, sample, scene * 100 + sample * 10, dimension));
    }
  }
  return records;
}

}  // namespace vidsearch_tests
