#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "../../metainfo/metainfo.hpp"


namespace maketorrent::create {

    inline constexpr std::string_view kVersion = "v0.1.0";
    inline constexpr std::string_view kCreatedBy = "maketorrent v0.1.0";

    // Upper bound for CreateOptions::workers.
    inline constexpr unsigned kMaxWorkers = 256;

    // Invalid options; raised before any file is touched.
    struct ConfigError : std::runtime_error { using std::runtime_error::runtime_error; };

    // Missing target, unreadable entry, failed read or a file that changed while hashing.
    struct InputError : std::runtime_error { using std::runtime_error::runtime_error; };

    // Destination could not be written.
    struct OutputError : std::runtime_error { using std::runtime_error::runtime_error; };


    struct Piece
    {
        uint64_t index{0};
        std::vector<char> bytes;
    };


    struct FileList
    {
        std::filesystem::path baseDir;              // entries' paths are relative to this
        bool singleFile{false};
        std::vector<metainfo::FileEntry> files;     // enumeration order == stream order
        uint64_t totalLength{0};
    };


    struct PieceLengthRange
    {
        unsigned minExponent{16};   // 64 KiB
        unsigned maxExponent{25};   // 32 MiB
    };


    struct CreateOptions
    {
        std::filesystem::path target;
        std::string name;                           // empty => base name of target
        std::vector<std::string> announce;          // first URL is the primary tracker
        std::string comment;
        bool isPrivate{false};
        uint32_t pieceLength{1u << 18};
        PieceLengthRange pieceLengthRange{};
        unsigned workers{0};                        // 0 => hardware concurrency, at most kMaxWorkers
        std::optional<int64_t> creationDate;        // empty => now
        std::string createdBy{kCreatedBy};
    };


    // Base name of a target path, ignoring trailing separators ("dir/" -> "dir").
    std::string defaultName(const std::filesystem::path& target);

} // namespace maketorrent::create
