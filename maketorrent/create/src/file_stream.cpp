#include <algorithm>
#include <cerrno>
#include <cstring>
#include "../include/file_stream.hpp"


namespace maketorrent::create {

    static constexpr const char* kLogger = "FileStream";


    FileStream::FileStream(std::filesystem::path baseDir,
                           const std::vector<metainfo::FileEntry>& files,
                           logger::LoggerPtr log)
        : baseDir_(std::move(baseDir)), files_(files), log_(std::move(log)) {}


    bool FileStream::openNext() {
        if (next_ >= files_.size()) return false;

        const auto& entry = files_[next_++];
        currentPath_ = baseDir_ / entry.path;

        in_.open(currentPath_, std::ios::binary);
        if (!in_.is_open()) {
            throw InputError("cannot open '" + currentPath_.string() + "': " + std::strerror(errno));
        }
        leftInFile_ = entry.length;

        MT_LOG(log_, logger::LogLevel::trace, kLogger) << "opened " << currentPath_.string()
                                                       << " at stream offset " << position_;
        return true;
    }


    void FileStream::closeCurrent() {
        if (in_.is_open()) in_.close();
        in_.clear();
    }


    std::size_t FileStream::read(char* dst, std::size_t n) {
        std::size_t total = 0;

        while (total < n) {
            if (leftInFile_ == 0) {
                closeCurrent();
                if (!openNext()) break;
                continue;   // zero-length files fall straight through
            }

            const auto want = static_cast<std::size_t>(std::min<uint64_t>(n - total, leftInFile_));
            in_.read(dst + total, static_cast<std::streamsize>(want));
            const auto got = static_cast<std::size_t>(in_.gcount());

            total += got;
            leftInFile_ -= got;
            position_ += got;

            if (got < want) {
                const auto missing = leftInFile_;
                const auto path = currentPath_.string();
                const bool eof = in_.eof();
                closeCurrent();
                if (eof) {
                    throw InputError("'" + path + "' is " + std::to_string(missing)
                                     + " bytes shorter than when it was listed");
                }
                throw InputError("read error on '" + path + "'");
            }

            if (leftInFile_ == 0) closeCurrent();
        }

        return total;
    }


} // namespace maketorrent::create
