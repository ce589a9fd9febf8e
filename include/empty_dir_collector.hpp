//
//  empty_dir_collector.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <filesystem>

#include "logging.hpp"

namespace trackshelf {

/**
 * @brief Remove empty directories below `root` (never `root` itself).
 *
 * The directory list is taken once up front and walked children-first, so a chain of
 * directories that only held each other is gone after a single call. Failures to remove
 * are logged and skipped.
 *
 * @return Number of directories removed.
 */
size_t delete_empty_directories(const std::filesystem::path &root, Logger &log);

}  // namespace trackshelf
