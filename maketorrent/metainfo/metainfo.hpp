#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "../bencode/bencode.hpp"


namespace maketorrent::metainfo {

    inline constexpr std::size_t kPieceHashSize = 20;

    using PieceHash = std::array<uint8_t, kPieceHashSize>;

    struct FileEntry
    {
        std::filesystem::path path;     // relative to the torrent root; base name in single-file mode
        uint64_t length{0};
        uint64_t offset{0};             // start of this file in the concatenated stream
    };

    // One contiguous part of a piece that lives inside a single file.
    struct FileSlice
    {
        std::size_t fileIndex{0};
        uint64_t offsetInFile{0};
        uint64_t length{0};

        bool operator==(const FileSlice&) const = default;
    };

    struct InfoDictionary
    {
        std::string name;
        std::vector<FileEntry> files;
        uint32_t pieceLength{0};
        std::vector<PieceHash> pieces;
        bool isPrivate{false};
        bool singleFile{false};                 // "length" mode rather than "files"
    };

    class Metainfo
    {
    public:
        static Metainfo assemble(InfoDictionary info,
                                 std::string announce,
                                 std::vector<std::string> announceList = {},
                                 std::string comment = {},
                                 int64_t creationDate = 0,
                                 std::string createdBy = {});

        static Metainfo fromTorrent(std::string_view data);

        // Throws std::logic_error when the piece table does not match the file list.
        void validate() const;

        bencode::BencodeValue infoValue() const;
        bencode::BencodeValue toBencode() const;
        std::string encode() const;
        nlohmann::json toJson() const;

        const std::vector<PieceHash>& pieces() const noexcept { return info.pieces; }
        uint32_t pieceLength() const noexcept { return info.pieceLength; }
        bool isSingleFile() const noexcept { return info.singleFile; }
        std::size_t numPieces() const noexcept { return info.pieces.size(); }

        uint64_t totalLength() const noexcept {
            uint64_t total = 0;
            for (const auto& f : info.files) total += f.length;
            return total;
        }

        uint64_t pieceSize(std::size_t index) const;
        std::vector<FileSlice> pieceRange(std::size_t index) const;

        PieceHash infoHash() const;
        std::string infoHashHex() const;

        InfoDictionary info;
        std::string announce;
        std::vector<std::string> announceList;     // additional trackers, primary excluded
        std::string comment;
        int64_t creationDate{0};
        std::string createdBy;
        std::string encoding{"UTF-8"};

    private:
        std::optional<PieceHash> parsedInfoHash_;  // set when read from raw bytes
    };

    uint64_t expectedPieceCount(uint64_t totalLength, uint32_t pieceLength) noexcept;
    bool isPowerOfTwo(uint64_t v) noexcept;
    std::string toHex(const PieceHash& h);

} // namespace maketorrent::metainfo
