//
//  stage_result.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "logging.hpp"

namespace trackshelf {

/// Pipeline step that produced a status; used to tag error log lines.
enum class Stage { Extract, Resolve, Move, Cleanup };

const char *stage_name(Stage stage);

/**
 * @brief Outcome of one recoverable pipeline step.
 *
 * When `ok == true`, `message` is empty. On failure, `message` carries a short description
 * (errno text, TagLib complaint, ...) and `stage` names the step that failed.
 */
struct StageStatus {
    bool ok{false};
    Stage stage{Stage::Extract};
    std::string message;
};

/// Value plus status; `value` is only meaningful when `status.ok`.
template <typename T>
struct StageResult {
    T value{};
    StageStatus status;

    bool ok() const { return status.ok; }
};

inline StageStatus stage_ok(Stage stage) { return StageStatus{true, stage, {}}; }

inline StageStatus stage_failed(Stage stage, std::string msg) {
    return StageStatus{false, stage, std::move(msg)};
}

template <typename T>
StageResult<T> stage_success(Stage stage, T value) {
    return StageResult<T>{std::move(value), stage_ok(stage)};
}

template <typename T>
StageResult<T> stage_failure(Stage stage, std::string msg) {
    return StageResult<T>{T{}, stage_failed(stage, std::move(msg))};
}

// Returns true when the caller may go on with `path`. A failed status is logged at error
// level, tagged with its stage, and the caller is expected to skip the item.
bool accept_or_skip(const StageStatus &status, const std::filesystem::path &path, Logger &log);

}  // namespace trackshelf
