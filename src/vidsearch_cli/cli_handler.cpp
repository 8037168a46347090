#include "vidsearch_cli/cli_handler.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>

#include "vidsearch_core/db/database_manager.hpp"
#include "vidsearch_core/encoder/clip_client.hpp"

namespace vidsearch_cli {

namespace {

// Collects values following a flag up to the next "--" argument
std::vector<std::string> collect_values(int argc, char* argv[], int& i) {
    std::vector<std::string> values;
    while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        values.emplace_back(argv[++i]);
    }
    return values;
}

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
    }
    return argv[++i];
}

int parse_top_k(const std::string& value) {
    try {
        size_t consumed = 0;
        int k = std::stoi(value, &consumed);
        if (consumed != value.size() || k < 1) {
            throw CliError("--top-k must be a positive integer, got: " + value);
        }
        return k;
    } catch (const std::logic_error&) {
        throw CliError("--top-k must be a positive integer, got: " + value);
    }
}

}  // namespace

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    // Pull out the global --config first so it may appear anywhere
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            options.config_path = require_value(argc, argv, i, arg);
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        options.command = Command::Help;
        return options;
    }

    std::vector<char*> rest;
    rest.push_back(argv[0]);
    for (auto& arg : args) {
        rest.push_back(arg.data());
    }
    const int n = static_cast<int>(rest.size());
    char** av = rest.data();

    const std::string command = args.front();

    if (command == "index" || command == "i") {
        options.command = Command::Index;
        for (int i = 2; i < n; ++i) {
            options.video_paths.emplace_back(av[i]);
        }
        if (options.video_paths.empty()) {
            throw CliError("Index command requires at least one video. Usage: index <video>...");
        }
    } else if (command == "index-dir" || command == "id") {
        options.command = Command::IndexDir;
        for (int i = 2; i < n; ++i) {
            std::string flag = av[i];
            if (flag == "--dir" || flag == "-d") {
                options.directory = require_value(n, av, i, flag);
            } else {
                throw CliError("Unknown option for index-dir: " + flag);
            }
        }
        if (options.directory.empty()) {
            throw CliError("Index-dir command requires a directory. Usage: index-dir --dir <path>");
        }
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        for (int i = 2; i < n; ++i) {
            std::string flag = av[i];
            if (flag == "--query" || flag == "-q") {
                options.query = require_value(n, av, i, flag);
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(require_value(n, av, i, flag));
            } else if (flag == "--no-save") {
                options.save_images = false;
            } else {
                throw CliError("Unknown option for search: " + flag);
            }
        }
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
    } else if (command == "similar") {
        options.command = Command::Similar;
        for (int i = 2; i < n; ++i) {
            std::string flag = av[i];
            if (flag == "--id") {
                options.frame_ids.push_back(require_value(n, av, i, flag));
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = parse_top_k(require_value(n, av, i, flag));
            } else {
                throw CliError("Unknown option for similar: " + flag);
            }
        }
        if (options.frame_ids.size() != 1) {
            throw CliError("Similar command requires one frame id. Usage: similar --id <frame_id>");
        }
    } else if (command == "list-videos" || command == "lv") {
        options.command = Command::ListVideos;
    } else if (command == "list-scenes" || command == "ls") {
        options.command = Command::ListScenes;
        for (int i = 2; i < n; ++i) {
            std::string flag = av[i];
            if (flag == "--video" || flag == "-v") {
                options.video_name = require_value(n, av, i, flag);
            } else {
                throw CliError("Unknown option for list-scenes: " + flag);
            }
        }
    } else if (command == "info") {
        options.command = Command::Info;
    } else if (command == "delete") {
        options.command = Command::Delete;
        for (int i = 2; i < n; ++i) {
            std::string flag = av[i];
            if (flag == "--id") {
                auto ids = collect_values(n, av, i);
                options.frame_ids.insert(options.frame_ids.end(), ids.begin(), ids.end());
            } else {
                throw CliError("Unknown option for delete: " + flag);
            }
        }
        if (options.frame_ids.empty()) {
            throw CliError("Delete command requires frame ids. Usage: delete --id <frame_id>...");
        }
    } else if (command == "clear") {
        options.command = Command::Clear;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

Config CliHandler::load_config(const std::optional<std::string>& config_path) {
    if (config_path) {
        return Config::from_file(*config_path);
    }
    const char* env_path = std::getenv("VIDSEARCH_CONFIG");
    if (env_path && *env_path) {
        return Config::from_file(env_path);
    }
    return Config::from_json(nlohmann::json::object());
}

void CliHandler::build_services() {
    auto db_manager = std::make_shared<vidsearch_core::DatabaseManager>(config_.storage_root);

    vidsearch_core::StoreOptions store_options;
    store_options.collection_name = config_.collection_name;
    store_options.dimension = config_.embedding_dimension;
    store_options.duplicate_policy =
        vidsearch_core::duplicate_policy_from_string(config_.duplicate_policy);
    store_options.busy_retries = config_.store_busy_retries;
    frame_store_ = std::make_shared<vidsearch_core::FrameStore>(db_manager, store_options);

    auto encoder = std::make_shared<vidsearch_core::ClipClient>(
        config_.encoder_url, config_.encoder_model, config_.encoder_timeout_seconds);
    extractor_ =
        std::make_shared<vidsearch_core::EmbeddingExtractor>(encoder, config_.embedding_dimension);
    video_factory_ = std::make_shared<vidsearch_core::VideoSourceFactory>();
}

std::unique_ptr<vidsearch_services::IndexingService> CliHandler::make_indexing_service() const {
    vidsearch_core::SegmenterOptions segmenter_options;
    segmenter_options.thresholds = config_.scene_thresholds;
    segmenter_options.min_scene_length = config_.min_scene_length;

    vidsearch_core::SamplerOptions sampler_options;
    sampler_options.samples_per_scene = config_.samples_per_scene;
    sampler_options.clamp_to_scene_end = config_.clamp_samples_to_scene;
    sampler_options.deduplicate = config_.deduplicate_samples;

    return std::make_unique<vidsearch_services::IndexingService>(
        frame_store_, extractor_, video_factory_,
        vidsearch_core::SceneSegmenter(segmenter_options),
        vidsearch_core::FrameSampler(sampler_options));
}

void CliHandler::execute_command(const CliOptions& options) {
    if (options.command == Command::Help) {
        handle_help_command(options);
        return;
    }

    config_ = load_config(options.config_path);
    try {
        build_services();
    } catch (const vidsearch_core::FrameStoreError& e) {
        throw CliError(std::string("Failed to open collection: ") + e.what());
    }

    switch (options.command) {
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::IndexDir:
            handle_index_dir_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Similar:
            handle_similar_command(options);
            break;
        case Command::ListVideos:
            handle_list_videos_command(options);
            break;
        case Command::ListScenes:
            handle_list_scenes_command(options);
            break;
        case Command::Info:
            handle_info_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Clear:
            handle_clear_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

void CliHandler::handle_index_command(const CliOptions& options) {
    std::vector<std::filesystem::path> paths(options.video_paths.begin(), options.video_paths.end());
    auto summary = make_indexing_service()->index_videos(paths);
    print_batch_summary(summary);
    if (summary.succeeded == 0) {
        throw CliError("No videos were indexed");
    }
}

void CliHandler::handle_index_dir_command(const CliOptions& options) {
    auto paths = vidsearch_services::IndexingService::videos_in_directory(options.directory,
                                                                         config_.video_extensions);
    if (paths.empty()) {
        throw CliError("No video files found in directory: " + options.directory);
    }
    std::cout << "Found " << paths.size() << " videos in " << options.directory << std::endl;
    auto summary = make_indexing_service()->index_videos(paths);
    print_batch_summary(summary);
    if (summary.succeeded == 0) {
        throw CliError("No videos were indexed");
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    const int k = options.top_k.value_or(options.save_images ? config_.default_image_top_k
                                                             : config_.default_top_k);
    vidsearch_services::SearchService search_service(frame_store_, extractor_, video_factory_,
                                                     config_.output_root);
    auto report = search_service.search_by_text(options.query, k, options.save_images);
    if (!report) {
        fail(report.error());
    }

    const auto& value = report.value();
    if (value.hits.empty()) {
        std::cout << "No results found" << std::endl;
        return;
    }

    std::cout << "\nFound " << value.hits.size() << " results:" << std::endl;
    print_hits(value.hits, /*show_similarity*/ true);

    if (options.save_images) {
        std::cout << "Saved " << value.saved_images.size() << " images to "
                  << value.output_dir.string() << std::endl;
        for (const auto& failure : value.frame_failures) {
            std::cerr << "Warning: could not save frame: " << failure.describe() << std::endl;
        }
    }
}

void CliHandler::handle_similar_command(const CliOptions& options) {
    const std::string& frame_id = options.frame_ids.front();
    vidsearch_services::CollectionService collection_service(frame_store_);
    auto hits = collection_service.similar_to_frame(frame_id,
                                                    options.top_k.value_or(config_.default_top_k));
    if (!hits) {
        if (hits.error().kind == vidsearch_core::ErrorKind::EmptyInput) {
            throw CliError("Frame ID '" + frame_id + "' not found");
        }
        fail(hits.error());
    }
    if (hits.value().empty()) {
        std::cout << "No similar frames found" << std::endl;
        return;
    }

    std::cout << "Similar frames to '" << frame_id << "':" << std::endl;
    std::cout << std::string(50, '-') << std::endl;
    print_hits(hits.value(), /*show_similarity*/ false);
}

void CliHandler::handle_list_videos_command(const CliOptions& options) {
    vidsearch_services::CollectionService collection_service(frame_store_);
    auto videos = collection_service.list_videos();
    if (!videos) {
        fail(videos.error());
    }
    if (videos.value().empty()) {
        std::cout << "No videos found in collection" << std::endl;
        return;
    }

    std::cout << "Videos in collection:" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    for (const auto& video : videos.value()) {
        std::cout << video.video_name << std::endl;
        std::cout << "   Path: " << video.video_path << std::endl;
        std::cout << "   Frames: " << video.frame_count << std::endl;
        std::cout << "   Scenes: " << video.scene_count << std::endl;
        std::cout << std::endl;
    }
}

void CliHandler::handle_list_scenes_command(const CliOptions& options) {
    vidsearch_services::CollectionService collection_service(frame_store_);
    auto scenes = collection_service.list_scenes(options.video_name);
    if (!scenes) {
        fail(scenes.error());
    }
    if (scenes.value().empty()) {
        if (options.video_name) {
            std::cout << "No frames found for video: " << *options.video_name << std::endl;
        } else {
            std::cout << "No frames found in collection" << std::endl;
        }
        return;
    }

    if (options.video_name) {
        std::cout << "Scenes in '" << *options.video_name << "':" << std::endl;
    } else {
        std::cout << "All scenes in collection:" << std::endl;
    }
    std::cout << std::string(30, '-') << std::endl;

    for (const auto& scene : scenes.value()) {
        if (options.video_name) {
            std::cout << "Scene " << scene.scene_idx << std::endl;
        } else {
            std::cout << scene.video_name << " - Scene " << scene.scene_idx << std::endl;
        }
        std::cout << "   Frames: " << scene.frame_ids.size() << std::endl;
        std::cout << "   Frame IDs: ";
        const size_t shown = std::min<size_t>(3, scene.frame_ids.size());
        for (size_t i = 0; i < shown; ++i) {
            std::cout << (i > 0 ? ", " : "") << scene.frame_ids[i];
        }
        std::cout << std::endl;
        if (scene.frame_ids.size() > 3) {
            std::cout << "   ... and " << (scene.frame_ids.size() - 3) << " more" << std::endl;
        }
        std::cout << std::endl;
    }
}

void CliHandler::handle_info_command(const CliOptions& options) {
    auto info = frame_store_->info();
    if (!info) {
        fail(info.error());
    }
    std::cout << "Collection: " << info.value().collection_name << std::endl;
    std::cout << "Total embeddings: " << info.value().total_embeddings << std::endl;
    std::cout << "Embedding dimension: " << info.value().dimension << std::endl;
    std::cout << "Database: " << info.value().db_path << std::endl;
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    auto removed = frame_store_->remove(options.frame_ids);
    if (!removed) {
        fail(removed.error());
    }
    std::cout << "Deleted " << removed.value() << " of " << options.frame_ids.size()
              << " requested frames" << std::endl;
}

void CliHandler::handle_clear_command(const CliOptions& options) {
    auto removed = frame_store_->clear();
    if (!removed) {
        fail(removed.error());
    }
    std::cout << "Collection '" << config_.collection_name << "' cleared (" << removed.value()
              << " embeddings removed)" << std::endl;
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

void CliHandler::print_batch_summary(const vidsearch_services::BatchSummary& summary) {
    for (const auto& result : summary.results) {
        if (!result.success) {
            std::cerr << "Failed: " << result.video_path << ": " << result.error->describe()
                      << std::endl;
        }
    }
    std::cout << "Indexed " << summary.succeeded << " of " << summary.results.size()
              << " videos, " << summary.total_embeddings << " embeddings" << std::endl;
}

void CliHandler::print_hits(const vidsearch_core::QueryResult& hits, bool show_similarity) {
    std::cout << std::fixed << std::setprecision(4);
    for (size_t i = 0; i < hits.size(); ++i) {
        const auto& hit = hits[i];
        std::cout << (i + 1) << ". " << hit.id << std::endl;
        std::cout << "   Video: " << hit.metadata.video_name << std::endl;
        std::cout << "   Scene: " << hit.metadata.scene_idx << ", Frame: " << hit.metadata.frame_idx
                  << std::endl;
        if (show_similarity) {
            std::cout << "   Similarity: " << hit.similarity().value_or(0.0f) << std::endl;
        } else {
            std::cout << "   Distance: " << hit.distance.value_or(0.0f) << std::endl;
        }
        std::cout << std::endl;
    }
    std::cout << std::defaultfloat;
}

void CliHandler::print_help() {
    std::cout << "vidsearch - semantic search over video frames\n\n";
    std::cout << "Usage: vidsearch [--config <file>] <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  index <video>...                 Index one or more video files\n";
    std::cout << "  index-dir --dir <path>           Index every video in a directory\n";
    std::cout << "  search --query <text> [--top-k N] [--no-save]\n";
    std::cout << "                                   Find frames matching a description\n";
    std::cout << "  similar --id <frame_id> [--top-k N]\n";
    std::cout << "                                   Find frames similar to a stored frame\n";
    std::cout << "  list-videos                      List indexed videos\n";
    std::cout << "  list-scenes [--video <name>]     List indexed scenes\n";
    std::cout << "  info                             Show collection statistics\n";
    std::cout << "  delete --id <frame_id>...        Remove frames from the collection\n";
    std::cout << "  clear                            Remove every frame from the collection\n";
    std::cout << "  help                             Show this help message\n\n";
    std::cout << "The configuration file may also be given through VIDSEARCH_CONFIG.\n";
}

void CliHandler::fail(const vidsearch_core::Failure& failure) {
    throw CliError(failure.describe());
}

}  // namespace vidsearch_cli
