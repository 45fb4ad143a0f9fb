#include <openssl/sha.h>
#include "../include/piece_hasher.hpp"


namespace maketorrent::create {


    metainfo::PieceHash PieceHasher::hash(const char* data, std::size_t len) noexcept {
        metainfo::PieceHash out{};
        SHA1(reinterpret_cast<const unsigned char*>(data), len, out.data());
        return out;
    }


} // namespace maketorrent::create
