//
//  metadata_extractor.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>

#include "stage_result.hpp"
#include "track_metadata.hpp"

namespace trackshelf {

/**
 * @brief Read title, artist, album artist, date and album from a tagged audio file.
 *
 * Individual missing fields come back as `kUnknownField`. A file TagLib cannot open, or one
 * without any tag data, yields a failed `Stage::Extract` status; nothing is thrown.
 */
StageResult<TrackMetadata> extract_metadata(const std::filesystem::path &path);

}  // namespace trackshelf
