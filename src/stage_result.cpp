//
//  stage_result.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "stage_result.hpp"

namespace trackshelf {

const char *stage_name(Stage stage) {
    switch (stage) {
    case Stage::Extract:
        return "extract";
    case Stage::Resolve:
        return "resolve";
    case Stage::Move:
        return "move";
    case Stage::Cleanup:
        return "cleanup";
    }
    return "unknown";
}

bool accept_or_skip(const StageStatus &status, const std::filesystem::path &path, Logger &log) {
    if (status.ok) {
        return true;
    }
    TS_LOG(log, "error", stage_name(status.stage) << " failed for " << path.string() << ": "
                                                  << status.message);
    return false;
}

}  // namespace trackshelf
