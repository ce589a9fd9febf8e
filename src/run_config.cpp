//
//  run_config.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "run_config.hpp"

#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace trackshelf {

std::string default_manifest_name() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << "musics_" << std::put_time(&local, "%Y%m%d") << ".csv";
    return oss.str();
}

bool load_config_json(const std::string &json_path, RunConfig &config, Logger &log) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        TS_LOG(log, "error", "open failed for " << json_path << " errno=" << errno << " ("
                                                << std::generic_category().message(errno)
                                                << ")");
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const json::parse_error &e) {
        TS_LOG(log, "error", "failed to parse config " << json_path << ": " << e.what());
        return false;
    }
    if (!j.is_object()) {
        TS_LOG(log, "error", "config " << json_path << " must hold a JSON object");
        return false;
    }

    // Work on a copy so a bad key leaves the caller's config untouched.
    RunConfig loaded = config;
    try {
        if (j.contains("folder_path")) {
            loaded.source_dir = j.at("folder_path").get<std::string>();
        }
        if (j.contains("base_folder")) {
            loaded.base_root = j.at("base_folder").get<std::string>();
        }
        if (j.contains("output_csv")) {
            loaded.manifest_path = j.at("output_csv").get<std::string>();
        }
        if (j.contains("delete_empty")) {
            loaded.delete_empty = j.at("delete_empty").get<bool>();
        }
        if (j.contains("batch_size")) {
            loaded.batch_size = j.at("batch_size").get<int64_t>();
        }
        if (j.contains("log_level")) {
            loaded.log_level = j.at("log_level").get<std::string>();
        }
    } catch (const json::exception &e) {
        TS_LOG(log, "error", "invalid config " << json_path << ": " << e.what());
        return false;
    }

    config = std::move(loaded);
    TS_LOG(log, "debug", "loaded config from " << json_path);
    return true;
}

}  // namespace trackshelf
