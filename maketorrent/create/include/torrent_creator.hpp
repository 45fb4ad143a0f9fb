#pragma once
#include "expected.hpp"
#include "hash_scheduler.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"
#include "../../metainfo/metainfo.hpp"


namespace maketorrent::create {


    // Configuration problems, without touching the filesystem.
    Expected<void> checkOptions(const CreateOptions& opts);


    /**
     * @brief Builds the metainfo for one target.
     *
     * enumerate -> stream -> segment -> hash on the pool -> collect -> assemble.
     * Throws ConfigError before any I/O, InputError on filesystem trouble.
     */
    class TorrentCreator
    {
    public:
        explicit TorrentCreator(CreateOptions opts, logger::LoggerPtr log = nullptr);

        void setProgressCallback(HashScheduler::ProgressCallback cb) { progress_ = std::move(cb); }

        metainfo::Metainfo create();

    private:
        CreateOptions opts_;
        logger::LoggerPtr log_;
        HashScheduler::ProgressCallback progress_;
    };


} // namespace maketorrent::create
