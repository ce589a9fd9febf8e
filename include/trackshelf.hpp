//
//  trackshelf.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "logging.hpp"
#include "run_config.hpp"

namespace trackshelf {

/// @defgroup api TrackShelf Public API
/// Public, supported C++ interfaces for sorting a music tree by its tags.
/// @{

/**
 * @brief Result of one organize run.
 *
 * `ok` only says whether the run itself completed; individual files can still have been
 * skipped (see `skipped` and the error log). On failure `message` says why the run stopped.
 */
struct RunStatus {
    bool ok{false};
    std::string message;
    size_t candidates = 0;  ///< music files found by the scan
    size_t processed = 0;   ///< moved and written to the manifest
    size_t skipped = 0;     ///< left in place
    size_t batches = 0;
    size_t removed_dirs = 0;
};

/// Invoked after every candidate file with (files handled so far, total candidates).
using ProgressCallback = std::function<void(size_t done, size_t total)>;

/**
 * @brief Return the TrackShelf version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Move every music file below `config.source_dir` into the tag based layout.
 *
 * Opens the manifest for appending and writes a header line, scans the source tree once,
 * processes the candidates in batches of `config.batch_size` and, when
 * `config.delete_empty` is set, removes emptied folders below the source afterwards.
 *
 * @param config Source, destination, manifest, cleanup flag and batch size.
 * @param log Receives per-file errors and progress notes.
 * @param progress Optional per-file progress hook.
 */
RunStatus organize_library(const RunConfig &config, Logger &log,
                           const ProgressCallback &progress = {});  ///< @ingroup api

/// @}

}  // namespace trackshelf
