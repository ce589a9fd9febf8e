//
//  trackshelf.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "trackshelf.hpp"
#include "trackshelf_version.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "batch_processor.hpp"
#include "empty_dir_collector.hpp"
#include "manifest_writer.hpp"
#include "tree_scanner.hpp"

namespace trackshelf {

std::string version_string() { return TRACKSHELF_VERSION_DISPLAY; }

namespace {

RunStatus make_failure(std::string msg) {
    RunStatus status;
    status.ok = false;
    status.message = std::move(msg);
    return status;
}

// Checks the inputs that make a run pointless; empty string when all is fine.
std::string validate(const RunConfig &config) {
    std::error_code ec;
    if (!std::filesystem::exists(config.source_dir, ec)) {
        return "source folder " + config.source_dir.string() + " does not exist" +
               (ec ? " (" + ec.message() + ")" : std::string());
    }
    if (!std::filesystem::is_directory(config.source_dir, ec)) {
        return "source " + config.source_dir.string() + " is not a directory";
    }
    if (config.batch_size < 1) {
        return "batch size must be at least 1, got " + std::to_string(config.batch_size);
    }
    return {};
}

}  // namespace

RunStatus organize_library(const RunConfig &config, Logger &log,
                           const ProgressCallback &progress) {
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    if (auto problem = validate(config); !problem.empty()) {
        TS_LOG(log, "error", problem);
        return make_failure(std::move(problem));
    }

    std::error_code ec;
    std::filesystem::create_directories(config.base_root, ec);
    if (ec) {
        std::string msg =
            "cannot create destination root " + config.base_root.string() + ": " + ec.message();
        TS_LOG(log, "error", msg);
        return make_failure(std::move(msg));
    }

    const std::filesystem::path manifest_path =
        config.manifest_path.empty() ? std::filesystem::path(default_manifest_name())
                                     : config.manifest_path;
    ManifestWriter manifest;
    std::string open_error;
    if (!manifest.open(manifest_path, open_error)) {
        TS_LOG(log, "error", "cannot open manifest: " << open_error);
        return make_failure("cannot open manifest: " + open_error);
    }
    if (!manifest.write_header()) {
        TS_LOG(log, "error", "cannot write manifest header to " << manifest_path.string());
        return make_failure("cannot write manifest header to " + manifest_path.string());
    }

    RunStatus status;
    const std::vector<std::filesystem::path> files = scan_music_files(config.source_dir, log);
    status.candidates = files.size();
    TS_LOG(log, "info", "found " << files.size() << " music file(s) in "
                                 << config.source_dir.string());
    const auto t_scan = clock::now();

    const size_t batch_size = static_cast<size_t>(config.batch_size);
    size_t done = 0;
    auto on_file_done = [&]() {
        ++done;
        if (progress) {
            progress(done, files.size());
        }
    };
    for (size_t first = 0; first < files.size(); first += batch_size) {
        const size_t last = std::min(files.size(), first + batch_size);
        const std::vector<std::filesystem::path> batch(files.begin() + first,
                                                       files.begin() + last);
        const BatchStats stats =
            process_batch(batch, manifest, config.base_root, log, on_file_done);
        status.processed += stats.processed;
        status.skipped += stats.skipped;
        ++status.batches;
        if (!stats.manifest_ok) {
            if (!manifest.close()) {
                TS_LOG(log, "warn", "closing manifest " << manifest_path.string() << " failed too");
            }
            status.ok = false;
            status.message = "manifest write failed for " + manifest_path.string();
            return status;
        }
    }
    const auto t_move = clock::now();

    if (!manifest.close()) {
        TS_LOG(log, "error", "failed to close manifest " << manifest_path.string());
        status.ok = false;
        status.message = "failed to close manifest " + manifest_path.string();
        return status;
    }

    if (config.delete_empty) {
        status.removed_dirs = delete_empty_directories(config.source_dir, log);
    }

    auto ms = [](auto a, auto b) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count();
    };
    TS_LOG(log, "info", "moved " << status.processed << " of " << status.candidates
                                 << " file(s), skipped " << status.skipped << "; manifest "
                                 << manifest_path.string());
    TS_LOG(log, "debug", "organize_library timings ms: scan=" << ms(t0, t_scan)
                                                              << " move=" << ms(t_scan, t_move)
                                                              << " total="
                                                              << ms(t0, clock::now()));
    status.ok = true;
    return status;
}

}  // namespace trackshelf
