#include <chrono>
#include <string>
#include "../include/announce_url.hpp"
#include "../include/file_enumerator.hpp"
#include "../include/file_stream.hpp"
#include "../include/piece_segmenter.hpp"
#include "../include/torrent_creator.hpp"


namespace maketorrent::create {


    static int64_t nowSeconds() {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }


    Expected<void> checkOptions(const CreateOptions& opts) {
        const auto& range = opts.pieceLengthRange;
        if (range.minExponent > range.maxExponent || range.maxExponent > 31) {
            return Expected<void>::failure("invalid piece length range");
        }

        const uint64_t minLen = uint64_t{1} << range.minExponent;
        const uint64_t maxLen = uint64_t{1} << range.maxExponent;
        if (!metainfo::isPowerOfTwo(opts.pieceLength) || opts.pieceLength < minLen || opts.pieceLength > maxLen) {
            return Expected<void>::failure("piece length " + std::to_string(opts.pieceLength)
                + " must be a power of two between " + std::to_string(minLen) + " and " + std::to_string(maxLen));
        }

        if (opts.announce.empty()) {
            return Expected<void>::failure("You need to specify at least one announce URL!");
        }
        for (const auto& url : opts.announce) {
            auto ok = validateAnnounceUrl(url);
            if (!ok.has_value()) return ok;
        }

        if (opts.target.empty()) {
            return Expected<void>::failure("no target file or directory");
        }
        if ((opts.name.empty() ? defaultName(opts.target) : opts.name).empty()) {
            return Expected<void>::failure("cannot derive a torrent name from '" + opts.target.string()
                + "', use --name");
        }

        if (opts.workers > kMaxWorkers) {
            return Expected<void>::failure("thread count " + std::to_string(opts.workers)
                + " exceeds the maximum of " + std::to_string(kMaxWorkers));
        }

        return Expected<void>::success();
    }


    TorrentCreator::TorrentCreator(CreateOptions opts, logger::LoggerPtr log)
        : opts_(std::move(opts)), log_(std::move(log))
    {}


    metainfo::Metainfo TorrentCreator::create() {
        auto ok = checkOptions(opts_);
        if (!ok.has_value()) {
            throw ConfigError(ok.error->message);
        }

        FileList list = enumerateFiles(opts_.target, log_);
        const uint64_t pieceCount = metainfo::expectedPieceCount(list.totalLength, opts_.pieceLength);

        if (log_) {
            logger::LogRecord rec;
            rec.level = logger::LogLevel::info;
            rec.logger = "TorrentCreator";
            rec.msg = std::to_string(list.files.size()) + " files, " + std::to_string(pieceCount)
                    + " pieces of " + std::to_string(opts_.pieceLength) + " bytes";
            rec.path = opts_.target.string();
            rec.bytes = static_cast<int64_t>(list.totalLength);
            log_->log(std::move(rec));
        }

        std::vector<metainfo::PieceHash> hashes;
        {
            HashScheduler scheduler(pieceCount, opts_.workers, log_, progress_);
            FileStream stream(list.baseDir, list.files, log_);
            PieceSegmenter segmenter(opts_.pieceLength, log_);

            const auto emitted = segmenter.run(stream, [&](Piece&& p) { scheduler.submit(std::move(p)); });
            MT_LOG(log_, logger::LogLevel::debug, "TorrentCreator")
                << "segmented " << emitted << " pieces from " << stream.position() << " bytes";

            hashes = scheduler.collect();
        }

        metainfo::InfoDictionary info;
        info.name = opts_.name.empty() ? defaultName(opts_.target) : opts_.name;
        info.files = std::move(list.files);
        info.pieceLength = opts_.pieceLength;
        info.pieces = std::move(hashes);
        info.isPrivate = opts_.isPrivate;
        info.singleFile = list.singleFile;

        std::vector<std::string> extra(opts_.announce.begin() + 1, opts_.announce.end());

        auto mi = metainfo::Metainfo::assemble(std::move(info),
                                               opts_.announce.front(),
                                               std::move(extra),
                                               opts_.comment,
                                               opts_.creationDate.value_or(nowSeconds()),
                                               opts_.createdBy);

        MT_LOG(log_, logger::LogLevel::info, "TorrentCreator") << "info hash " << mi.infoHashHex();
        return mi;
    }


} // namespace maketorrent::create
