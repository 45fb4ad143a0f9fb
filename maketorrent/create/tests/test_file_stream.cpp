#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include "test_util.hpp"
#include "../include/file_enumerator.hpp"
#include "../include/file_stream.hpp"

using namespace maketorrent;
using namespace maketorrent::create;
using mt_test::TempDir;
using mt_test::writeFile;

static std::string drain(IByteSource& src, std::size_t chunk) {
    std::string out;
    std::vector<char> buf(chunk);
    for (;;) {
        auto n = src.read(buf.data(), buf.size());
        out.append(buf.data(), n);
        if (n < chunk) break;
    }
    return out;
}

TEST_CASE("FileStream: concatenates files across boundaries") {
    TempDir dir("stream_concat");
    writeFile(dir / "a", "abc");
    writeFile(dir / "b", "defgh");
    writeFile(dir / "c", "ij");

    auto list = enumerateFiles(dir.path());
    FileStream stream(list.baseDir, list.files);

    char buf[4];
    REQUIRE(stream.read(buf, 4) == 4);
    CHECK(std::string(buf, 4) == "abcd");
    REQUIRE(stream.read(buf, 4) == 4);
    CHECK(std::string(buf, 4) == "efgh");
    REQUIRE(stream.read(buf, 4) == 2);
    CHECK(std::string(buf, 2) == "ij");
    CHECK(stream.read(buf, 4) == 0);
    CHECK(stream.position() == 10);
}

TEST_CASE("FileStream: any chunk size yields the same bytes") {
    TempDir dir("stream_chunks");
    const auto a = mt_test::pattern(1000, 1);
    const auto b = mt_test::pattern(17, 2);
    const auto c = mt_test::pattern(4096, 3);
    writeFile(dir / "1", a);
    writeFile(dir / "2", b);
    writeFile(dir / "3", c);

    auto list = enumerateFiles(dir.path());
    for (std::size_t chunk : {1u, 7u, 16u, 1000u, 1017u, 8192u}) {
        FileStream stream(list.baseDir, list.files);
        CHECK(drain(stream, chunk) == a + b + c);
    }
}

TEST_CASE("FileStream: zero-length files are skipped") {
    TempDir dir("stream_zero");
    writeFile(dir / "1", "xy");
    writeFile(dir / "2", "");
    writeFile(dir / "3", "");
    writeFile(dir / "4", "z");
    writeFile(dir / "5", "");

    auto list = enumerateFiles(dir.path());
    FileStream stream(list.baseDir, list.files);
    CHECK(drain(stream, 2) == "xyz");
    CHECK_FALSE(stream.isOpen());
}

TEST_CASE("FileStream: closes each file after its last byte") {
    TempDir dir("stream_close");
    writeFile(dir / "a", "1234");
    writeFile(dir / "b", "5678");

    auto list = enumerateFiles(dir.path());
    FileStream stream(list.baseDir, list.files);

    char buf[4];
    REQUIRE(stream.read(buf, 4) == 4);
    CHECK_FALSE(stream.isOpen());
    REQUIRE(stream.read(buf, 2) == 2);
    CHECK(stream.isOpen());
}

TEST_CASE("FileStream: file shrunk after listing throws InputError") {
    TempDir dir("stream_shrink");
    writeFile(dir / "a", std::string(8, 'a'));
    writeFile(dir / "b", std::string(8, 'b'));

    auto list = enumerateFiles(dir.path());
    writeFile(dir / "b", std::string(3, 'b'));

    FileStream stream(list.baseDir, list.files);
    std::vector<char> buf(16);
    CHECK_THROWS_AS(stream.read(buf.data(), buf.size()), InputError);
    CHECK_FALSE(stream.isOpen());
}

TEST_CASE("FileStream: bytes appended after listing are not read") {
    TempDir dir("stream_grow");
    writeFile(dir / "a", "abc");

    auto list = enumerateFiles(dir.path());
    writeFile(dir / "a", "abcdef");

    FileStream stream(list.baseDir, list.files);
    CHECK(drain(stream, 16) == "abc");
}

TEST_CASE("FileStream: removed file throws InputError") {
    TempDir dir("stream_removed");
    writeFile(dir / "a", "abc");

    auto list = enumerateFiles(dir.path());
    std::filesystem::remove(dir / "a");

    FileStream stream(list.baseDir, list.files);
    char buf[4];
    CHECK_THROWS_AS(stream.read(buf, 4), InputError);
}
