//
//  file_mover.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "file_mover.hpp"

#include <string>
#include <system_error>

namespace trackshelf {

namespace {

using std::filesystem::path;

static StageResult<path> move_failed(const path &source, const std::string &why) {
    return stage_failure<path>(Stage::Move, "cannot move " + source.string() + ": " + why);
}

}  // namespace

StageResult<path> move_by_copy(const path &source, const path &target, Logger &log) {
    // Stage next to the target so the final rename stays on one filesystem and an existing
    // target is only replaced once the source is really gone.
    path staging = target;
    staging += ".trackshelf-part";

    std::error_code ec;
    std::filesystem::copy_file(source, staging, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(staging, cleanup_ec);
        return move_failed(source, "copy to " + staging.string() + " failed: " + ec.message());
    }
    std::filesystem::remove(source, ec);
    if (ec) {
        std::error_code undo_ec;
        std::filesystem::remove(staging, undo_ec);
        if (undo_ec) {
            TS_LOG(log, "warn", "could not remove partial copy " << staging.string() << ": "
                                                                  << undo_ec.message());
        }
        return move_failed(source, "removing original after copy failed: " + ec.message());
    }
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        // The only copy left is the staged one; leave it for the user.
        return move_failed(source, "source removed but " + staging.string() +
                                       " could not be renamed to " + target.string() + ": " +
                                       ec.message());
    }
    TS_LOG(log, "debug", "copied " << source.string() << " -> " << target.string()
                                   << " (cross-device move)");
    return stage_success(Stage::Move, target);
}

StageResult<path> move_file(const path &source, const path &destination_dir, Logger &log) {
    const path target = destination_dir / source.filename();

    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        return move_failed(source, ec ? ec.message() : "source does not exist");
    }

    if (std::filesystem::exists(target, ec)) {
        if (std::filesystem::equivalent(source, target, ec)) {
            TS_LOG(log, "debug", source.string() << " already in place");
            return stage_success(Stage::Move, target);
        }
        TS_LOG(log, "warn", "overwriting existing file " << target.string() << " with "
                                                          << source.string());
    }

    ec.clear();
    std::filesystem::rename(source, target, ec);
    if (!ec) {
        TS_LOG(log, "debug", "moved " << source.string() << " -> " << target.string());
        return stage_success(Stage::Move, target);
    }
    if (ec == std::errc::cross_device_link) {
        return move_by_copy(source, target, log);
    }
    return move_failed(source, ec.message());
}

}  // namespace trackshelf
