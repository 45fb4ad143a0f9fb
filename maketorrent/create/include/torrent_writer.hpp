#pragma once
#include <filesystem>
#include <string_view>


namespace maketorrent::create {

    // Writes <path>.part and renames it over path, so a failed run never leaves a
    // truncated torrent behind. Throws OutputError.
    void writeTorrentFile(const std::filesystem::path& path, std::string_view bytes);

} // namespace maketorrent::create
