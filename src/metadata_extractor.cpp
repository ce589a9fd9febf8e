//
//  metadata_extractor.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "metadata_extractor.hpp"

#include <exception>
#include <string>
#include <utility>

#include <taglib/fileref.h>
#include <taglib/tfile.h>
#include <taglib/tpropertymap.h>

namespace {

// First value stored under `key`, or the unknown marker.
static std::string first_value(const TagLib::PropertyMap &props, const char *key) {
    auto it = props.find(key);
    if (it == props.end() || it->second.isEmpty()) {
        return trackshelf::kUnknownField;
    }
    return it->second.front().to8Bit(true);
}

}  // namespace

namespace trackshelf {

StageResult<TrackMetadata> extract_metadata(const std::filesystem::path &path) {
    const std::string file_name = path.string();
    try {
        TagLib::FileRef ref(file_name.c_str(), false);
        if (ref.isNull() || ref.file() == nullptr) {
            return stage_failure<TrackMetadata>(Stage::Extract,
                                                "not readable as a tagged audio file");
        }
        const TagLib::PropertyMap props = ref.file()->properties();
        if (props.isEmpty()) {
            return stage_failure<TrackMetadata>(Stage::Extract, "no tag data found");
        }

        TrackMetadata meta;
        meta.name = first_value(props, "TITLE");
        meta.artists = first_value(props, "ARTIST");
        meta.main_artist = first_value(props, "ALBUMARTIST");
        meta.year = first_value(props, "DATE");
        meta.album = first_value(props, "ALBUM");
        return stage_success(Stage::Extract, std::move(meta));
    } catch (const std::exception &e) {
        return stage_failure<TrackMetadata>(Stage::Extract,
                                            std::string("tag reader threw: ") + e.what());
    }
}

}  // namespace trackshelf
