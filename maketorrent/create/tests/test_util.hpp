#pragma once
#include <openssl/sha.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

#include "../../metainfo/metainfo.hpp"

// Shared fixtures for the create tests: a scratch directory and an independent SHA-1 oracle.

namespace mt_test {

    namespace fs = std::filesystem;

    class TempDir
    {
    public:
        explicit TempDir(const std::string& tag) {
            path_ = fs::temp_directory_path() / ("mt_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter()++));
            fs::remove_all(path_);
            fs::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }
        fs::path operator/(const fs::path& rel) const { return path_ / rel; }

    private:
        static int& counter() { static int n = 0; return n; }
        fs::path path_;
    };

    inline void writeFile(const fs::path& p, const std::string& bytes) {
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    inline std::string readFile(const fs::path& p) {
        std::ifstream f(p, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    // n bytes, each distinct from its neighbours, starting from seed
    inline std::string pattern(std::size_t n, unsigned seed = 0) {
        std::string s(n, '\0');
        for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 7 + seed * 13 + 1) & 0xff);
        return s;
    }

    inline maketorrent::metainfo::PieceHash sha1(const std::string& bytes) {
        maketorrent::metainfo::PieceHash h{};
        SHA1(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), h.data());
        return h;
    }

} // namespace mt_test
