#pragma once
#include <cstddef>
#include <string_view>
#include <vector>
#include "../../metainfo/metainfo.hpp"


namespace maketorrent::create {


    // SHA-1 of one piece's bytes. Stateless and safe to call from any thread.
    struct PieceHasher
    {
        static metainfo::PieceHash hash(const char* data, std::size_t len) noexcept;
        static metainfo::PieceHash hash(const std::vector<char>& bytes) noexcept { return hash(bytes.data(), bytes.size()); }
        static metainfo::PieceHash hash(std::string_view bytes) noexcept { return hash(bytes.data(), bytes.size()); }
    };


} // namespace maketorrent::create
