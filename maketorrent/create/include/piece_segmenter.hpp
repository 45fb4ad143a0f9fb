#pragma once
#include <cstdint>
#include <functional>
#include "file_stream.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"


namespace maketorrent::create {


    // Cuts a byte source into pieces of pieceLength bytes; only the last one may be short.
    class PieceSegmenter
    {
    public:
        using PieceSink = std::function<void(Piece&&)>;

        explicit PieceSegmenter(uint32_t pieceLength, logger::LoggerPtr log = nullptr);

        // Emits pieces in stream order with indices 0, 1, 2, ... and returns how many.
        uint64_t run(IByteSource& source, const PieceSink& sink);

    private:
        uint32_t pieceLength_;
        logger::LoggerPtr log_;
    };


} // namespace maketorrent::create
