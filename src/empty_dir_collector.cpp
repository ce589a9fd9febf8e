//
//  empty_dir_collector.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "empty_dir_collector.hpp"

#include <system_error>
#include <vector>

#include "stage_result.hpp"

namespace trackshelf {

namespace {

namespace fs = std::filesystem;

// Pre-order list of directories below root; symlinked directories are not followed.
static std::vector<fs::path> list_directories(const fs::path &root, Logger &log) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        TS_LOG(log, "error", "cannot scan " << root.string() << " for empty folders: "
                                            << ec.message());
        return dirs;
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code type_ec;
        if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
            dirs.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            TS_LOG(log, "warn", "folder scan of " << root.string() << " stopped early: "
                                                  << ec.message());
            break;
        }
    }
    return dirs;
}

static StageStatus remove_if_empty(const fs::path &dir, bool &removed) {
    removed = false;
    std::error_code ec;
    const bool empty = fs::is_empty(dir, ec);
    if (ec) {
        return stage_failed(Stage::Cleanup, ec.message());
    }
    if (!empty) {
        return stage_ok(Stage::Cleanup);
    }
    fs::remove(dir, ec);
    if (ec) {
        return stage_failed(Stage::Cleanup, ec.message());
    }
    removed = true;
    return stage_ok(Stage::Cleanup);
}

}  // namespace

size_t delete_empty_directories(const fs::path &root, Logger &log) {
    const auto dirs = list_directories(root, log);
    size_t removed_count = 0;
    // Reverse pre-order visits every child before its parent.
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        bool removed = false;
        if (!accept_or_skip(remove_if_empty(*it, removed), *it, log)) {
            continue;
        }
        if (removed) {
            ++removed_count;
            TS_LOG(log, "info", "Deleted empty folder: " << it->string());
        }
    }
    return removed_count;
}

}  // namespace trackshelf
