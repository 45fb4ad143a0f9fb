#include <stdexcept>
#include "../include/piece_segmenter.hpp"


namespace maketorrent::create {


    PieceSegmenter::PieceSegmenter(uint32_t pieceLength, logger::LoggerPtr log)
        : pieceLength_(pieceLength), log_(std::move(log))
    {
        if (pieceLength_ == 0) throw std::invalid_argument("piece length must be positive");
    }


    uint64_t PieceSegmenter::run(IByteSource& source, const PieceSink& sink) {
        uint64_t index = 0;

        for (;;) {
            // Fresh buffer per piece: ownership moves to the sink together with the piece.
            std::vector<char> buf(pieceLength_);
            const auto n = source.read(buf.data(), buf.size());
            if (n == 0) break;

            buf.resize(n);
            MT_LOG(log_, logger::LogLevel::trace, "PieceSegmenter") << "piece " << index << " (" << n << " bytes)";
            sink(Piece{index++, std::move(buf)});

            if (n < pieceLength_) break;
        }

        return index;
    }


} // namespace maketorrent::create
