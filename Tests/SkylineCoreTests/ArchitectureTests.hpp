#pragma once

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#ifndef SKYLINE_SOURCE_DIR
#error "SKYLINE_SOURCE_DIR must point at the source tree"
#endif

namespace architecture_tests {

namespace fs = std::filesystem;

/// Files allowed to write through a local SQLite handle: the handle itself,
/// the daemon that owns the write handles, and WAL maintenance.
inline const std::set<std::string>& direct_write_allowlist() {
    static const std::set<std::string> files = {"db.hpp", "db.cpp", "daemon.cpp", "checkpoint.cpp"};
    return files;
}

inline const std::vector<std::string>& direct_write_patterns() {
    static const std::vector<std::string> patterns = {
        "sqlite3_exec(", ".execute(", "->execute(", "begin_transaction(", "transaction tx(",
    };
    return patterns;
}

struct violation {
    std::string file;
    size_t line;
    std::string pattern;
};

inline std::vector<violation> scan_file(const fs::path& path) {
    std::vector<violation> found;
    std::ifstream in(path);
    std::string text;
    size_t line_no = 0;
    while (std::getline(in, text)) {
        ++line_no;
        for (const auto& pattern : direct_write_patterns()) {
            if (text.find(pattern) != std::string::npos) {
                found.push_back({path.string(), line_no, pattern});
            }
        }
    }
    return found;
}

inline std::vector<fs::path> source_files(const fs::path& root) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto ext = entry.path().extension();
        if (ext == ".cpp" || ext == ".hpp" || ext == ".h") files.push_back(entry.path());
    }
    return files;
}

// ============================================================================
// test_writes_go_through_daemon: no local write paths outside the allowlist
// ============================================================================

void test_writes_go_through_daemon() {
    std::cout << "  test_writes_go_through_daemon..." << std::flush;

    const fs::path root = fs::path(SKYLINE_SOURCE_DIR) / "Sources";
    assert(fs::is_directory(root));

    size_t scanned = 0;
    size_t allowed_hits = 0;
    std::vector<violation> violations;
    for (const auto& file : source_files(root)) {
        ++scanned;
        auto hits = scan_file(file);
        if (direct_write_allowlist().count(file.filename().string())) {
            allowed_hits += hits.size();
            continue;
        }
        violations.insert(violations.end(), hits.begin(), hits.end());
    }

    for (const auto& v : violations) {
        std::cerr << std::endl << "    direct write in " << v.file << ":" << v.line
                  << " (" << v.pattern << ")";
    }
    assert(scanned > 10);
    // The scanner must see the sanctioned write paths, or it is not looking.
    assert(allowed_hits > 0);
    assert(violations.empty());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Architecture tests:" << std::endl;
    test_writes_go_through_daemon();
}

} // namespace architecture_tests
