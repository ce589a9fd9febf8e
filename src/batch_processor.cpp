//
//  batch_processor.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "batch_processor.hpp"

#include <utility>

#include "destination_resolver.hpp"
#include "file_mover.hpp"
#include "metadata_extractor.hpp"

namespace trackshelf {

namespace {

// Runs all stages for one file; false means it was skipped.
static bool process_file(const std::filesystem::path &file, ManifestWriter &manifest,
                         const std::filesystem::path &base_root, Logger &log) {
    auto meta = extract_metadata(file);
    if (!accept_or_skip(meta.status, file, log)) {
        return false;
    }

    auto dir = resolve_destination(meta.value, base_root);
    if (!accept_or_skip(dir.status, file, log)) {
        return false;
    }

    auto moved = move_file(file, dir.value, log);
    if (!accept_or_skip(moved.status, file, log)) {
        return false;
    }

    manifest.append(ManifestRow{std::move(meta.value), std::move(moved.value)});
    return true;
}

}  // namespace

BatchStats process_batch(const std::vector<std::filesystem::path> &files,
                         ManifestWriter &manifest, const std::filesystem::path &base_root,
                         Logger &log, const FileDoneCallback &on_file_done) {
    BatchStats stats;
    for (const auto &file : files) {
        if (process_file(file, manifest, base_root, log)) {
            ++stats.processed;
        } else {
            ++stats.skipped;
        }
        if (on_file_done) {
            on_file_done();
        }
    }

    if (!manifest.flush_batch()) {
        TS_LOG(log, "error", "failed to write " << stats.processed << " manifest row(s)");
        stats.manifest_ok = false;
    }
    TS_LOG(log, "debug", "batch done: " << stats.processed << " moved, " << stats.skipped
                                        << " skipped");
    return stats;
}

}  // namespace trackshelf
