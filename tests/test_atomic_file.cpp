#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <atomic>
#include <thread>

#include "test_support.hpp"
#include "utils/atomic_file.hpp"

using namespace harvest;
namespace fs = std::filesystem;

namespace {

std::string raw_bytes(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

std::string sample_text() {
    std::string s;
    for (int i = 0; i < 2000; ++i) s += "{\"venue\": \"ICML\", \"year\": " + std::to_string(2000 + i % 25) + "}\n";
    return s;
}

} // namespace

TEST(AtomicFileTest, WritesAndReadsPlainFile) {
    TempDir dir;
    auto path = dir.path() / "nested" / "status.json";
    ASSERT_TRUE(write_file_atomic(path, "{\"a\": 1}").ok);

    std::string content;
    auto rd = read_file(path, content);
    ASSERT_TRUE(rd.ok) << rd.error;
    EXPECT_EQ(content, "{\"a\": 1}");
}

TEST(AtomicFileTest, OverwriteLeavesNoTempFiles) {
    TempDir dir;
    auto path = dir.path() / "status.json";
    ASSERT_TRUE(write_file_atomic(path, "first").ok);
    ASSERT_TRUE(write_file_atomic(path, "second").ok);

    std::string content;
    ASSERT_TRUE(read_file(path, content).ok);
    EXPECT_EQ(content, "second");

    int entries = 0;
    for (const auto& e : fs::directory_iterator(dir.path())) {
        EXPECT_FALSE(is_temp_file(e.path())) << e.path();
        ++entries;
    }
    EXPECT_EQ(entries, 1);
}

TEST(AtomicFileTest, ReadersNeverSeeTornWrites) {
    TempDir dir;
    auto path = dir.path() / "status.json";
    const std::string a = sample_text();
    const std::string b(a.size() / 2, 'x');
    ASSERT_TRUE(write_file_atomic(path, a).ok);

    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) {
            if (!write_file_atomic(path, i % 2 ? a : b).ok) break;
        }
        done = true;
    });

    int reads = 0, torn = 0;
    do {
        std::string content;
        if (!read_file(path, content).ok) continue;
        ++reads;
        if (content != a && content != b) ++torn;
    } while (!done.load());
    writer.join();

    EXPECT_GT(reads, 0);
    EXPECT_EQ(torn, 0);
}

TEST(AtomicFileTest, GzExtensionCompressesTransparently) {
    TempDir dir;
    auto path = dir.path() / "cp.json.gz";
    auto text = sample_text();
    ASSERT_TRUE(write_file_atomic(path, text).ok);

    auto raw = raw_bytes(path);
    ASSERT_GE(raw.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(raw[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(raw[1]), 0x8b);
    EXPECT_LT(raw.size(), text.size());

    std::string content;
    ASSERT_TRUE(read_file(path, content).ok);
    EXPECT_EQ(content, text);
}

TEST(AtomicFileTest, MissingFileIsNotFound) {
    TempDir dir;
    std::string content;
    auto rd = read_file(dir.path() / "absent.json", content);
    EXPECT_FALSE(rd.ok);
    EXPECT_TRUE(rd.not_found);
}

TEST(AtomicFileTest, DamagedGzipIsAnErrorNotMissing) {
    TempDir dir;
    auto path = dir.path() / "cp.json.gz";
    std::ofstream(path, std::ios::binary) << "definitely not gzip";

    std::string content;
    auto rd = read_file(path, content);
    EXPECT_FALSE(rd.ok);
    EXPECT_FALSE(rd.not_found);
}

TEST(AtomicFileTest, TruncatedGzipThrows) {
    auto packed = gzip_compress(sample_text());
    EXPECT_EQ(gzip_decompress(packed), sample_text());
    EXPECT_THROW(gzip_decompress(packed.substr(0, packed.size() / 2)), std::runtime_error);
}

TEST(AtomicFileTest, RecognisesTempFiles) {
    EXPECT_TRUE(is_temp_file("sessions/x/session_status.json.1a2b3c4d.tmp"));
    EXPECT_FALSE(is_temp_file("sessions/x/session_status.json"));
}
