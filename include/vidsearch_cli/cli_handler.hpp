#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vidsearch_cli/config.hpp"
#include "vidsearch_core/result.hpp"
#include "vidsearch_services/collection_service.hpp"
#include "vidsearch_services/indexing_service.hpp"
#include "vidsearch_services/search_service.hpp"

namespace vidsearch_cli
{

  enum class Command
  {
    Index,
    IndexDir,
    Search,
    Similar,
    ListVideos,
    ListScenes,
    Info,
    Delete,
    Clear,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::vector<std::string> video_paths;
    std::string directory;
    std::string query;
    std::vector<std::string> frame_ids;
    std::optional<std::string> video_name;
    // Falls back to the configured default when not given
    std::optional<int> top_k;
    bool save_images = true;
    std::optional<std::string> config_path;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler() = default;

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Loads the configuration, opens the store and runs the command
    void execute_command(const CliOptions &options);

    // --config, then $VIDSEARCH_CONFIG, then built-in defaults
    static Config load_config(const std::optional<std::string> &config_path);

  private:
    Config config_ = Config::from_json(nlohmann::json::object());
    std::shared_ptr<vidsearch_core::FrameStore> frame_store_;
    std::shared_ptr<vidsearch_core::EmbeddingExtractor> extractor_;
    std::shared_ptr<vidsearch_core::VideoSourceFactory> video_factory_;

    void build_services();
    std::unique_ptr<vidsearch_services::IndexingService> make_indexing_service() const;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_index_dir_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_similar_command(const CliOptions &options);
    void handle_list_videos_command(const CliOptions &options);
    void handle_list_scenes_command(const CliOptions &options);
    void handle_info_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_clear_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    void print_batch_summary(const vidsearch_services::BatchSummary &summary);
    void print_hits(const vidsearch_core::QueryResult &hits, bool show_similarity);
    void print_help();
    [[noreturn]] static void fail(const vidsearch_core::Failure &failure);
  };

}  // namespace vidsearch_cli
