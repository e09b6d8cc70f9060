#pragma once
// =============================================================================
// Crash-safe file I/O for session state
//
// write_file_atomic: write <path>.<rand>.tmp, fsync, rename over <path>, fsync
// the parent directory. A reader either sees the previous file or the new
// one, never a torn write. Interrupted writers leave only a *.tmp file behind.
//
// Files whose name ends in ".gz" are gzip-compressed transparently (zlib).
// =============================================================================

#include <filesystem>
#include <string>

namespace harvest {

inline constexpr const char* TEMP_SUFFIX = ".tmp";

struct IoResult {
    bool ok = true;
    bool not_found = false;
    std::string error;

    static IoResult success() { return {}; }
    static IoResult failure(std::string msg, bool missing = false) {
        IoResult r;
        r.ok = false;
        r.not_found = missing;
        r.error = std::move(msg);
        return r;
    }
};

IoResult write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Reads the whole file (decompressing *.gz). not_found is set when the path
// does not exist.
IoResult read_file(const std::filesystem::path& path, std::string& out);

bool is_temp_file(const std::filesystem::path& path);

// gzip container via zlib deflate/inflate; throw std::runtime_error on
// zlib failure or truncated input.
std::string gzip_compress(const std::string& data);
std::string gzip_decompress(const std::string& data);

} // namespace harvest
