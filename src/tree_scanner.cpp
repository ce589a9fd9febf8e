//
//  tree_scanner.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tree_scanner.hpp"

#include <algorithm>
#include <string>
#include <system_error>

namespace trackshelf {

bool is_music_file(const std::filesystem::path &path) {
    const std::string ext = path.extension().string();
    return std::find(kMusicExtensions.begin(), kMusicExtensions.end(), ext) !=
           kMusicExtensions.end();
}

std::vector<std::filesystem::path> scan_music_files(const std::filesystem::path &root,
                                                    Logger &log) {
    namespace fs = std::filesystem;
    std::vector<fs::path> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        TS_LOG(log, "error", "cannot scan " << root.string() << ": " << ec.message());
        return files;
    }

    size_t visited = 0;
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry &entry = *it;
        ++visited;
        std::error_code type_ec;
        const bool is_dir = entry.is_directory(type_ec);
        if (type_ec) {
            TS_LOG(log, "warn", "skipping " << entry.path().string() << ": "
                                            << type_ec.message());
        } else if (!is_dir && is_music_file(entry.path())) {
            files.push_back(entry.path());
        }

        it.increment(ec);
        if (ec) {
            TS_LOG(log, "warn", "scan of " << root.string() << " stopped early: "
                                           << ec.message());
            break;
        }
    }

    TS_LOG(log, "debug", "scanned " << visited << " entries below " << root.string() << ", "
                                    << files.size() << " music file(s)");
    return files;
}

}  // namespace trackshelf
