//
//  manifest_writer.hpp
//  TrackShelf
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "track_metadata.hpp"

namespace trackshelf {

/// One manifest line: the tags that drove the move plus where the file ended up.
struct ManifestRow {
    TrackMetadata meta;
    std::filesystem::path new_path;
};

/**
 * @brief Append-only CSV manifest.
 *
 * Rows are buffered by append() and only reach the file on flush_batch(), so a crash loses
 * at most the batch in flight. Each run writes its own header line, so re-using a manifest
 * file yields one header per run.
 */
class ManifestWriter {
  public:
    static constexpr const char *kHeader[] = {"Name", "Artists", "Main Artist",
                                              "Year", "Album",   "New Path"};

    ManifestWriter() = default;
    ~ManifestWriter();

    ManifestWriter(const ManifestWriter &) = delete;
    ManifestWriter &operator=(const ManifestWriter &) = delete;

    // Open `path` for appending; on failure returns false and fills `error`.
    bool open(const std::filesystem::path &path, std::string &error);
    bool is_open() const { return out_.is_open(); }

    bool write_header();
    void append(ManifestRow row);
    // Write every buffered row and flush the stream; false on I/O error.
    bool flush_batch();
    // Flush anything still buffered and close the file.
    bool close();

    size_t pending_rows() const { return pending_.size(); }
    size_t rows_written() const { return rows_written_; }

  private:
    bool write_line(const std::vector<std::string> &fields);

    std::ofstream out_;
    std::vector<ManifestRow> pending_;
    size_t rows_written_ = 0;
};

// Quote a CSV field when it holds a comma, quote or line break; quotes are doubled.
std::string csv_escape(const std::string &field);

}  // namespace trackshelf
