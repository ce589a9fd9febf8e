//
//  logging.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

namespace trackshelf {

LogVerbosity parse_log_level(const std::string &name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

Logger::Logger(LogVerbosity level, std::ostream *sink)
    : level_(static_cast<int>(level)), sink_(sink ? sink : &std::cerr) {}

void Logger::set_verbosity(LogVerbosity level) {
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity Logger::verbosity() const {
    return static_cast<LogVerbosity>(level_.load(std::memory_order_relaxed));
}

bool Logger::should_log(const char *level) const {
    const auto sev = severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= level_.load(std::memory_order_relaxed);
}

void Logger::write(const char *level, const std::string &msg, const char *file, int line,
                   const char *func) {
    std::string lvl(level ? level : "");
    std::lock_guard<std::mutex> lock(mutex_);
    if (lvl == "error") {
        *sink_ << "[TrackShelf][" << lvl << "][" << file << ":" << line << " " << func << "] "
               << msg << std::endl;
    } else {
        *sink_ << "[TrackShelf][" << lvl << "] " << msg << std::endl;
    }
}

}  // namespace trackshelf
