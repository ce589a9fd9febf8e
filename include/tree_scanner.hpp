//
//  tree_scanner.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <filesystem>
#include <string_view>
#include <vector>

#include "logging.hpp"

namespace trackshelf {

/// Extensions picked up by the scanner; compared case-sensitively.
inline constexpr std::array<std::string_view, 4> kMusicExtensions = {".mp3", ".flac", ".wav",
                                                                     ".m4a"};

bool is_music_file(const std::filesystem::path &path);

// Every non-directory entry below `root` with a music extension, in traversal order.
std::vector<std::filesystem::path> scan_music_files(const std::filesystem::path &root,
                                                    Logger &log);

}  // namespace trackshelf
