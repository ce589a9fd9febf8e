//
//  batch_processor.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

#include "logging.hpp"
#include "manifest_writer.hpp"

namespace trackshelf {

struct BatchStats {
    size_t processed = 0;  ///< moved and recorded in the manifest
    size_t skipped = 0;    ///< left in place after a failed stage
    bool manifest_ok = true;
};

/// Called once per file of a batch, after it has been handled (moved or skipped).
using FileDoneCallback = std::function<void()>;

/**
 * @brief Extract, resolve and move every file of one batch, in order.
 *
 * A failure in any stage is logged and skips only that file. Rows for moved files are
 * buffered in `manifest` and flushed once the batch is done.
 */
BatchStats process_batch(const std::vector<std::filesystem::path> &files,
                         ManifestWriter &manifest, const std::filesystem::path &base_root,
                         Logger &log, const FileDoneCallback &on_file_done = {});

}  // namespace trackshelf
