//
//  manifest_writer.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "manifest_writer.hpp"

#include <cerrno>
#include <iterator>
#include <system_error>
#include <utility>

namespace trackshelf {

namespace {
constexpr const char *kLineEnd = "\r\n";
}  // namespace

std::string csv_escape(const std::string &field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

ManifestWriter::~ManifestWriter() {
    if (out_.is_open()) {
        out_.close();
    }
}

bool ManifestWriter::open(const std::filesystem::path &path, std::string &error) {
    out_.open(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        error = "open failed for " + path.string() + " errno=" + std::to_string(errno) + " (" +
                std::generic_category().message(errno) + ")";
        return false;
    }
    return true;
}

bool ManifestWriter::write_line(const std::vector<std::string> &fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i != 0) {
            out_ << ',';
        }
        out_ << csv_escape(fields[i]);
    }
    out_ << kLineEnd;
    return out_.good();
}

bool ManifestWriter::write_header() {
    std::vector<std::string> fields(std::begin(kHeader), std::end(kHeader));
    if (!write_line(fields)) {
        return false;
    }
    out_.flush();
    return out_.good();
}

void ManifestWriter::append(ManifestRow row) { pending_.emplace_back(std::move(row)); }

bool ManifestWriter::flush_batch() {
    bool ok = true;
    for (const auto &row : pending_) {
        const auto &m = row.meta;
        ok &= write_line({m.name, m.artists, m.main_artist, m.year, m.album,
                          row.new_path.string()});
        if (!ok) {
            break;
        }
        ++rows_written_;
    }
    pending_.clear();
    out_.flush();
    return ok && out_.good();
}

bool ManifestWriter::close() {
    if (!out_.is_open()) {
        return true;
    }
    bool ok = pending_.empty() || flush_batch();
    out_.close();
    return ok && !out_.fail();
}

}  // namespace trackshelf
