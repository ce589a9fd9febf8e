//
//  main.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <unistd.h>

#include "logging.hpp"
#include "run_config.hpp"
#include "trackshelf.hpp"
#include "trackshelf_version.hpp"

namespace {

// Erase line + carriage return, keeps the progress indicator on one line.
constexpr const char *kClearLine = "\033[2K\r";

void print_usage() {
    std::cerr << "TrackShelf " << TRACKSHELF_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  trackshelf [--folder_path DIR] [--base_folder DIR] [--output_csv FILE]\n"
              << "             [--delete_empty] [--batch_size N] [--config FILE]\n"
              << "             [--log-level error|warn|info|debug] [--no-progress]\n"
              << "Options:\n"
              << "  --folder_path DIR   Folder containing the music files (default: .).\n"
              << "  --base_folder DIR   Root of the sorted Letter/Artist/Album layout (default: .).\n"
              << "  --output_csv FILE   Manifest to append to (default: musics_YYYYMMDD.csv).\n"
              << "  --delete_empty      Delete empty folders below folder_path afterwards.\n"
              << "  --batch_size N      Files per manifest flush (default: 100).\n"
              << "  --config FILE       JSON file with any of the options above;\n"
              << "                      command line values win.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --no-progress       Do not draw the progress line.\n";
}

std::optional<int64_t> parse_batch_size(const std::string &s) {
    try {
        size_t used = 0;
        const long long v = std::stoll(s, &used);
        if (used != s.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(v);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

// Command line values; unset ones fall back to config file or defaults.
struct CliOverrides {
    std::optional<std::string> folder_path;
    std::optional<std::string> base_folder;
    std::optional<std::string> output_csv;
    std::optional<int64_t> batch_size;
    std::optional<std::string> log_level;
    bool delete_empty = false;
};

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "TrackShelf " << TRACKSHELF_VERSION_DISPLAY << "\n";
        return 0;
    }

    CliOverrides cli;
    std::string config_path;
    bool show_progress = isatty(STDERR_FILENO) != 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--delete_empty") {
            cli.delete_empty = true;
        } else if (arg == "--no-progress") {
            show_progress = false;
        } else if (arg == "--folder_path" && has_value) {
            cli.folder_path = argv[++i];
        } else if (arg == "--base_folder" && has_value) {
            cli.base_folder = argv[++i];
        } else if (arg == "--output_csv" && has_value) {
            cli.output_csv = argv[++i];
        } else if (arg == "--config" && has_value) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            cli.log_level = argv[++i];
        } else if (arg == "--batch_size" && has_value) {
            cli.batch_size = parse_batch_size(argv[++i]);
            if (!cli.batch_size) {
                std::cerr << "Invalid batch size: " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 2;
        }
    }

    trackshelf::Logger log;
    if (cli.log_level) {
        log.set_verbosity(trackshelf::parse_log_level(*cli.log_level));
    }

    trackshelf::RunConfig config;
    if (!config_path.empty()) {
        if (!trackshelf::load_config_json(config_path, config, log)) {
            return 2;
        }
        if (!cli.log_level) {
            log.set_verbosity(trackshelf::parse_log_level(config.log_level));
        }
    }
    if (cli.folder_path) config.source_dir = *cli.folder_path;
    if (cli.base_folder) config.base_root = *cli.base_folder;
    if (cli.output_csv) config.manifest_path = *cli.output_csv;
    if (cli.batch_size) config.batch_size = *cli.batch_size;
    if (cli.delete_empty) config.delete_empty = true;
    if (config.manifest_path.empty()) {
        config.manifest_path = trackshelf::default_manifest_name();
    }

    trackshelf::ProgressCallback progress;
    if (show_progress) {
        progress = [](size_t done, size_t total) {
            std::cerr << kClearLine << "Processing files: " << done << "/" << total
                      << (done == total ? "\n" : "") << std::flush;
        };
    }

    const auto status = trackshelf::organize_library(config, log, progress);
    if (!status.ok) {
        TS_LOG(log, "error", "trackshelf: run failed: " << status.message);
        return 1;
    }

    std::cout << "Moved " << status.processed << " of " << status.candidates << " file(s)";
    if (status.skipped != 0) {
        std::cout << ", skipped " << status.skipped;
    }
    if (config.delete_empty) {
        std::cout << ", removed " << status.removed_dirs << " empty folder(s)";
    }
    std::cout << "\nManifest: " << config.manifest_path.string() << "\n";
    return 0;
}
