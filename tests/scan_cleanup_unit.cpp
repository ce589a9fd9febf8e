// Unit coverage for the tree scanner's extension filter and the empty-folder collector.
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "empty_dir_collector.hpp"
#include "logging.hpp"
#include "test_utils.hpp"
#include "tree_scanner.hpp"

namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[scan_cleanup_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::vector<std::string> relative_sorted(const std::vector<fs::path> &paths, const fs::path &root) {
    std::vector<std::string> out;
    for (const auto &p : paths) {
        out.push_back(p.lexically_relative(root).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool test_extension_filter(const fs::path &root) {
    std::ostringstream sink;
    trackshelf::Logger log(trackshelf::LogVerbosity::Info, &sink);
    const auto src = root / "scan";
    test_utils::write_bytes(src / "a.mp3", "a");
    test_utils::write_bytes(src / "b.FLAC", "b");
    test_utils::write_bytes(src / "c.txt", "c");
    test_utils::write_bytes(src / "sub" / "d.flac", "d");
    test_utils::write_bytes(src / "sub" / "deeper" / "e.wav", "e");
    test_utils::write_bytes(src / "f.m4a", "f");
    test_utils::write_bytes(src / "g.mp3.bak", "g");
    fs::create_directories(src / "folder.mp3");

    const auto found = trackshelf::scan_music_files(src, log);
    const std::vector<std::string> expected = {"a.mp3", "f.m4a", "sub/d.flac",
                                               "sub/deeper/e.wav"};
    bool ok = check(relative_sorted(found, src) == expected,
                    "only lower-case music extensions, directories excluded");
    ok &= check(trackshelf::scan_music_files(src, log) == found, "scan order is stable");

    ok &= check(trackshelf::is_music_file("x.m4a"), "m4a recognised");
    ok &= check(!trackshelf::is_music_file("x.MP3"), "match is case-sensitive");
    ok &= check(!trackshelf::is_music_file(".mp3"), "bare dot-file has no extension");
    return ok;
}

bool test_missing_root(const fs::path &root) {
    std::ostringstream sink;
    trackshelf::Logger log(trackshelf::LogVerbosity::Info, &sink);
    const auto found = trackshelf::scan_music_files(root / "does-not-exist", log);
    bool ok = check(found.empty(), "missing root yields nothing");
    ok &= check(sink.str().find("[TrackShelf][error]") != std::string::npos,
                "missing root logged as error");
    return ok;
}

bool test_cleanup(const fs::path &root) {
    std::ostringstream sink;
    trackshelf::Logger log(trackshelf::LogVerbosity::Info, &sink);
    const auto tree = root / "cleanup";
    fs::create_directories(tree / "empty" / "a" / "b");
    fs::create_directories(tree / "lonely");
    test_utils::write_bytes(tree / "keep" / "file.txt", "x");
    fs::create_directories(tree / "keep" / "hollow");

    const size_t first = trackshelf::delete_empty_directories(tree, log);
    bool ok = check(first == 5, "nested and sibling empty folders removed in one pass");
    ok &= check(!fs::exists(tree / "empty"), "empty chain removed");
    ok &= check(!fs::exists(tree / "lonely"), "single empty folder removed");
    ok &= check(!fs::exists(tree / "keep" / "hollow"), "empty child of kept folder removed");
    ok &= check(fs::exists(tree / "keep" / "file.txt"), "non-empty folder kept");
    ok &= check(fs::exists(tree), "root never removed");
    ok &= check(test_utils::count_occurrences(sink.str(), "Deleted empty folder: ") == 5,
                "one info line per deletion");

    sink.str("");
    const size_t second = trackshelf::delete_empty_directories(tree, log);
    ok &= check(second == 0, "second pass removes nothing");
    ok &= check(sink.str().empty(), "second pass logs nothing");

    const auto bare = root / "bare";
    fs::create_directories(bare);
    ok &= check(trackshelf::delete_empty_directories(bare, log) == 0, "empty root kept");
    ok &= check(fs::exists(bare), "empty root still exists");
    return ok;
}

bool test_cleanup_continues_after_failure(const fs::path &root) {
    if (test_utils::running_as_root()) {
        std::fprintf(stderr, "[scan_cleanup_unit] skipping read-only folder case as root\n");
        return true;
    }
    std::ostringstream sink;
    trackshelf::Logger log(trackshelf::LogVerbosity::Info, &sink);
    const auto tree = root / "stubborn";
    fs::create_directories(tree / "locked" / "stuck");
    fs::create_directories(tree / "free");

    bool ok = true;
    {
        test_utils::ScopedReadOnlyDir lock(tree / "locked");
        const size_t removed = trackshelf::delete_empty_directories(tree, log);
        ok &= check(removed == 1, "sibling removed although one folder could not be");
        ok &= check(!fs::exists(tree / "free"), "removable sibling gone");
        ok &= check(fs::exists(tree / "locked" / "stuck"), "folder in read-only parent kept");
        ok &= check(test_utils::count_occurrences(sink.str(), "[TrackShelf][error]") == 1,
                    "one error line for the stuck folder");
        ok &= check(sink.str().find("cleanup failed for " + (tree / "locked" / "stuck").string()) !=
                        std::string::npos,
                    "error names the cleanup stage and folder");
    }

    sink.str("");
    ok &= check(trackshelf::delete_empty_directories(tree, log) == 2,
                "once writable, the rest is cleaned up");
    ok &= check(!fs::exists(tree / "locked"), "former read-only chain removed");
    return ok;
}

}  // namespace

int main() {
    test_utils::ScopedTempDir tmp("trackshelf_scan");
    bool ok = true;
    ok &= test_extension_filter(tmp.path());
    ok &= test_missing_root(tmp.path());
    ok &= test_cleanup(tmp.path());
    ok &= test_cleanup_continues_after_failure(tmp.path());
    return ok ? 0 : 1;
}
