#include "atomic_file.hpp"
#include "id_util.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <zlib.h>

namespace harvest {

namespace fs = std::filesystem;

static bool has_gz_extension(const fs::path& path) {
    return path.extension() == ".gz";
}

bool is_temp_file(const fs::path& path) {
    return path.extension() == TEMP_SUFFIX;
}

std::string gzip_compress(const std::string& data) {
    z_stream zs{};
    // 15 window bits + 16 selects the gzip wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("deflate failed");
        }
        out.append(chunk, sizeof(chunk) - zs.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return out;
}

std::string gzip_decompress(const std::string& data) {
    z_stream zs{};
    // 15 + 32: auto-detect zlib or gzip header
    if (inflateInit2(&zs, 15 + 32) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string msg = zs.msg ? zs.msg : "inflate failed";
            inflateEnd(&zs);
            throw std::runtime_error("gzip: " + msg);
        }
        out.append(chunk, sizeof(chunk) - zs.avail_out);
        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error("gzip: truncated stream");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

static IoResult write_fully(int fd, const std::string& bytes, const fs::path& tmp) {
    const char* data = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return IoResult::failure("write " + tmp.string() + ": " + std::strerror(errno));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        return IoResult::failure("fsync " + tmp.string() + ": " + std::strerror(errno));
    }
    return IoResult::success();
}

IoResult write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return IoResult::failure("create_directories " + path.parent_path().string() +
                                 ": " + ec.message());
    }

    std::string bytes;
    if (has_gz_extension(path)) {
        try {
            bytes = gzip_compress(content);
        } catch (const std::runtime_error& e) {
            return IoResult::failure(path.string() + ": " + e.what());
        }
    } else {
        bytes = content;
    }

    fs::path tmp = path;
    tmp += "." + random_hex(8) + TEMP_SUFFIX;

    int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return IoResult::failure("open " + tmp.string() + ": " + std::strerror(errno));
    }
    IoResult wr = write_fully(fd, bytes, tmp);
    ::close(fd);
    if (!wr.ok) {
        fs::remove(tmp, ec);
        return wr;
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return IoResult::failure("rename " + tmp.string() + " -> " + path.string() +
                                 ": " + ec.message());
    }

    // Persist the rename itself
    int dfd = ::open(path.parent_path().c_str(), O_RDONLY);
    if (dfd >= 0) {
        if (::fsync(dfd) != 0) {
            LOG_WRN("[io] fsync dir %s: %s", path.parent_path().c_str(), std::strerror(errno));
        }
        ::close(dfd);
    }
    return IoResult::success();
}

IoResult read_file(const fs::path& path, std::string& out) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return IoResult::failure(path.string() + ": not found", true);
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        // Renamed or deleted between the check and the open
        if (!fs::exists(path, ec)) {
            return IoResult::failure(path.string() + ": not found", true);
        }
        return IoResult::failure("open " + path.string() + ": " + std::strerror(errno));
    }
    std::string raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return IoResult::failure("read " + path.string() + " failed");
    }

    if (has_gz_extension(path)) {
        try {
            out = gzip_decompress(raw);
        } catch (const std::runtime_error& e) {
            return IoResult::failure(path.string() + ": " + e.what());
        }
    } else {
        out = std::move(raw);
    }
    return IoResult::success();
}

} // namespace harvest
