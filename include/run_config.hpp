//
//  run_config.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "logging.hpp"

namespace trackshelf {

inline constexpr int64_t kDefaultBatchSize = 100;

/// Everything one organize run needs; filled from defaults, a JSON file and the CLI.
struct RunConfig {
    std::filesystem::path source_dir = ".";   ///< tree to scan
    std::filesystem::path base_root = ".";    ///< root of the sorted layout
    std::filesystem::path manifest_path;      ///< CSV manifest; empty picks default_manifest_name()
    bool delete_empty = false;                ///< remove emptied source folders afterwards
    int64_t batch_size = kDefaultBatchSize;   ///< files per manifest flush, >= 1
    std::string log_level = "info";
};

// "musics_YYYYMMDD.csv" for today's local date, evaluated at call time.
std::string default_manifest_name();

/**
 * @brief Overlay the keys found in a JSON config file onto `config`.
 *
 * Recognised keys: folder_path, base_folder, output_csv, delete_empty, batch_size,
 * log_level. Unknown keys are ignored. Returns false (and logs why) when the file cannot be
 * read, is not valid JSON, or a key has the wrong type.
 */
bool load_config_json(const std::string &json_path, RunConfig &config, Logger &log);

}  // namespace trackshelf
