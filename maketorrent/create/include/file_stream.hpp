#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace maketorrent::create {


    struct IByteSource
    {
        virtual ~IByteSource() = default;

        // Fills up to n bytes; fewer only at end of stream, 0 once exhausted.
        virtual std::size_t read(char* dst, std::size_t n) = 0;
    };


    /**
     * @brief The ordered file list seen as one contiguous byte stream.
     *
     * Reads cross file boundaries transparently. Exactly one file is open at a time and
     * it is closed as soon as its last byte has been delivered. Each file contributes
     * exactly its enumerated length: a file that turns out shorter throws InputError,
     * trailing bytes of a file that grew are not read.
     */
    class FileStream : public IByteSource
    {
    public:
        FileStream(std::filesystem::path baseDir,
                   const std::vector<metainfo::FileEntry>& files,
                   logger::LoggerPtr log = nullptr);

        std::size_t read(char* dst, std::size_t n) override;

        uint64_t position() const noexcept { return position_; }
        bool isOpen() const { return in_.is_open(); }

    private:
        bool openNext();
        void closeCurrent();

        std::filesystem::path baseDir_;
        const std::vector<metainfo::FileEntry>& files_;
        logger::LoggerPtr log_;

        std::size_t next_{0};
        std::ifstream in_;
        std::filesystem::path currentPath_;
        uint64_t leftInFile_{0};
        uint64_t position_{0};
    };


} // namespace maketorrent::create
