//
//  destination_resolver.cpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "destination_resolver.hpp"

#include <system_error>
#include <utility>

namespace trackshelf {

namespace {

// Byte length of the UTF-8 sequence introduced by `lead`; 0 for a stray continuation byte.
static size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Decodes the code point at the front of `s`; false for malformed input.
static bool decode_first_code_point(const std::string &s, char32_t &cp, size_t &len) {
    const auto lead = static_cast<unsigned char>(s[0]);
    len = utf8_sequence_length(lead);
    if (len == 0 || len > s.size()) {
        return false;
    }
    static constexpr unsigned char kLeadMask[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    cp = lead & kLeadMask[len];
    for (size_t i = 1; i < len; ++i) {
        const auto cont = static_cast<unsigned char>(s[i]);
        if ((cont & 0xC0) != 0x80) {
            return false;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    return true;
}

static std::string encode_utf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

// Simple upper-case mapping for Basic Latin, Latin-1, Latin Extended-A, Greek and Cyrillic.
// Anything else (CJK, digits, symbols) has no case and is returned unchanged.
static char32_t to_upper_code_point(char32_t cp) {
    if (cp >= U'a' && cp <= U'z') return cp - 0x20;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (cp == 0xFF) return 0x178;
    if (cp == 0x131) return U'I';
    if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
        return (cp & 1) ? cp - 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp & 1) ? cp : cp - 1;
    }
    if (cp == 0x3AC) return 0x386;
    if (cp >= 0x3AD && cp <= 0x3AF) return cp - 0x25;
    if (cp == 0x3C2) return 0x3A3;
    if (cp >= 0x3B1 && cp <= 0x3CB) return cp - 0x20;
    if (cp == 0x3CC) return 0x38C;
    if (cp == 0x3CD || cp == 0x3CE) return cp - 0x3F;
    if (cp >= 0x430 && cp <= 0x44F) return cp - 0x20;
    if (cp >= 0x450 && cp <= 0x45F) return cp - 0x50;
    return cp;
}

static bool is_dot_name(const std::string &name) { return name == "." || name == ".."; }

static std::string or_unknown(std::string value) {
    return value.empty() ? std::string(kUnknownField) : value;
}

}  // namespace

std::string sanitize_folder_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (kForbiddenFolderChars.find(c) == std::string_view::npos) {
            out.push_back(c);
        }
    }
    return out;
}

std::string first_letter_of(const std::string &main_artist) {
    if (main_artist.empty() || main_artist == kUnknownField) {
        return kUnknownField;
    }
    char32_t cp = 0;
    size_t len = 0;
    if (!decode_first_code_point(main_artist, cp, len)) {
        // Not UTF-8; the first byte goes through unchanged.
        return main_artist.substr(0, 1);
    }
    return encode_utf8(to_upper_code_point(cp));
}

std::filesystem::path destination_dir_for(const TrackMetadata &meta,
                                          const std::filesystem::path &base_root) {
    std::string album = or_unknown(sanitize_folder_name(meta.album));
    if (is_dot_name(album)) {
        album = kUnknownField;
    }

    // The artist goes in verbatim (slashes nest). Root, "." and ".." parts are dropped so
    // the result always stays below base_root.
    std::filesystem::path artist_part;
    for (const auto &part : std::filesystem::path(or_unknown(meta.main_artist)).relative_path()) {
        const std::string name = part.string();
        if (name.empty() || is_dot_name(name)) {
            continue;
        }
        artist_part /= part;
    }
    if (artist_part.empty()) {
        artist_part = kUnknownField;
    }
    return base_root / first_letter_of(artist_part.string()) / artist_part / album;
}

StageResult<std::filesystem::path> resolve_destination(const TrackMetadata &meta,
                                                       const std::filesystem::path &base_root) {
    auto dir = destination_dir_for(meta, base_root);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return stage_failure<std::filesystem::path>(
            Stage::Resolve, "cannot create " + dir.string() + ": " + ec.message());
    }
    return stage_success(Stage::Resolve, std::move(dir));
}

}  // namespace trackshelf
