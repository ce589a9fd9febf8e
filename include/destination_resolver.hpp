//
//  destination_resolver.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "stage_result.hpp"
#include "track_metadata.hpp"

namespace trackshelf {

/// Characters stripped from folder names: < > : " / \ | ? *
inline constexpr std::string_view kForbiddenFolderChars = "<>:\"/\\|?*";

// Remove every forbidden character; may return an empty string.
std::string sanitize_folder_name(std::string_view name);

// First-level folder: "Unknown" for an unknown artist, else the first character upper-cased.
std::string first_letter_of(const std::string &main_artist);

// base_root / letter / main_artist / sanitized album. Pure; touches no files.
std::filesystem::path destination_dir_for(const TrackMetadata &meta,
                                          const std::filesystem::path &base_root);

// Same as destination_dir_for(), then creates the directory chain.
StageResult<std::filesystem::path> resolve_destination(const TrackMetadata &meta,
                                                       const std::filesystem::path &base_root);

}  // namespace trackshelf
