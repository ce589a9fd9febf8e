//
//  file_mover.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>

#include "logging.hpp"
#include "stage_result.hpp"

namespace trackshelf {

/**
 * @brief Move `source` into `destination_dir`, keeping its file name.
 *
 * An existing file of the same name is replaced (logged as a warning). Moving a file onto
 * itself succeeds without touching it. Cross-device moves are done as copy + remove.
 * On failure the file stays where it was and a `Stage::Move` status is returned.
 *
 * @return The final path of the file.
 */
StageResult<std::filesystem::path> move_file(const std::filesystem::path &source,
                                             const std::filesystem::path &destination_dir,
                                             Logger &log);

// Cross-device fallback of move_file(): copies `source` to a staging file beside `target`,
// removes `source`, then renames the staging file onto `target`. If `source` cannot be
// removed, the staging file is dropped and `target` is left untouched.
StageResult<std::filesystem::path> move_by_copy(const std::filesystem::path &source,
                                                const std::filesystem::path &target, Logger &log);

}  // namespace trackshelf
