//
//  logging.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace trackshelf {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Map a level name ("error", "warn", "info", "debug") to its verbosity.
// Anything unrecognised is treated as debug-level.
constexpr LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return LogVerbosity::Warn;
    }
    if (tag == "info") {
        return LogVerbosity::Info;
    }
    return LogVerbosity::Debug;
}

// Parse a user supplied level name; unknown names map to error-only output.
LogVerbosity parse_log_level(const std::string &name);

/**
 * @brief Line oriented logger handed to every pipeline component.
 *
 * The entry point owns the instance; components only hold a reference. Writes are
 * serialized so one logger may be shared between threads.
 */
class Logger {
  public:
    explicit Logger(LogVerbosity level = LogVerbosity::Info, std::ostream *sink = &std::cerr);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    void set_verbosity(LogVerbosity level);
    LogVerbosity verbosity() const;

    bool should_log(const char *level) const;
    void write(const char *level, const std::string &msg, const char *file, int line,
               const char *func);

  private:
    std::atomic<int> level_;
    std::ostream *sink_;
    std::mutex mutex_;
};

}  // namespace trackshelf

#define TS_LOG(logger, level, message)                                      \
    do {                                                                    \
        if ((logger).should_log(level)) {                                   \
            std::ostringstream _ts_log_ss;                                  \
            _ts_log_ss << message;                                          \
            (logger).write(level, _ts_log_ss.str(), __FILE__, __LINE__,     \
                           __func__);                                       \
        }                                                                   \
    } while (0)
