//
//  track_metadata.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace trackshelf {

/// Placeholder for any tag field the file does not carry.
inline constexpr const char *kUnknownField = "Unknown";

/**
 * @brief Tag fields used to place a track.
 *
 * Fields are UTF-8; a missing tag holds `kUnknownField`.
 */
struct TrackMetadata {
    std::string name = kUnknownField;         ///< Track title
    std::string artists = kUnknownField;      ///< Track artist(s)
    std::string main_artist = kUnknownField;  ///< Album artist, drives the folder layout
    std::string year = kUnknownField;         ///< Release date (free-form)
    std::string album = kUnknownField;        ///< Album/collection
};

}  // namespace trackshelf
