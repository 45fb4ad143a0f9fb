#include <algorithm>
#include <stdexcept>
#include <string>
#include "../include/hash_scheduler.hpp"
#include "../include/piece_hasher.hpp"


namespace maketorrent::create {


    static unsigned resolveWorkers(unsigned requested) {
        return requested == 0 ? HashScheduler::defaultWorkers() : requested;
    }


    unsigned HashScheduler::defaultWorkers() noexcept {
        return std::max(1u, std::thread::hardware_concurrency());
    }


    HashScheduler::HashScheduler(uint64_t expectedPieces, unsigned workers,
                                 logger::LoggerPtr log, ProgressCallback progress)
        : expected_(expectedPieces),
          log_(std::move(log)),
          progress_(std::move(progress)),
          queue_(2 * static_cast<std::size_t>(resolveWorkers(workers))),
          results_(expectedPieces)
    {
        const unsigned n = resolveWorkers(workers);
        try {
            threads_.reserve(n);
            for (unsigned i = 0; i < n; ++i) {
                threads_.emplace_back(&HashScheduler::workerLoop, this);
            }
        } catch (...) {
            // running workers must be joined before threads_ is destroyed
            queue_.abort();
            joinAll();
            throw;
        }
        MT_LOG(log_, logger::LogLevel::debug, "HashScheduler")
            << "started " << n << " workers for " << expected_ << " pieces";
    }


    HashScheduler::~HashScheduler() {
        queue_.abort();
        joinAll();
    }


    void HashScheduler::submit(Piece piece) {
        rethrowFailure();

        if (collected_) {
            throw std::logic_error("submit() after collect()");
        }
        if (piece.index != submitted_) {
            throw std::logic_error("piece " + std::to_string(piece.index) + " submitted out of order, expected "
                                   + std::to_string(submitted_));
        }
        if (piece.index >= expected_) {
            throw std::logic_error("piece " + std::to_string(piece.index) + " exceeds the expected count of "
                                   + std::to_string(expected_));
        }

        if (!queue_.push(std::move(piece))) {
            rethrowFailure();
            throw std::logic_error("hash queue closed");
        }
        ++submitted_;
    }


    std::vector<metainfo::PieceHash> HashScheduler::collect() {
        if (collected_) {
            throw std::logic_error("collect() called twice");
        }
        collected_ = true;

        // Workers drain what is queued, then exit.
        queue_.close();
        {
            std::unique_lock<std::mutex> lock(mtx_);
            doneCv_.wait(lock, [this] { return completed_ == submitted_ || failure_; });
        }
        joinAll();
        rethrowFailure();

        if (submitted_ != expected_) {
            throw std::logic_error("expected " + std::to_string(expected_) + " pieces, got "
                                   + std::to_string(submitted_));
        }

        MT_LOG(log_, logger::LogLevel::debug, "HashScheduler") << "hashed " << completed() << " pieces";
        return std::move(results_);
    }


    void HashScheduler::workerLoop() {
        Piece piece;
        while (queue_.pop(piece)) {
            try {
                results_[piece.index] = PieceHasher::hash(piece.bytes);
                piece.bytes = {};

                uint64_t done;
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    done = ++completed_;
                }
                doneCv_.notify_all();
                if (progress_) progress_(done, expected_);
            } catch (...) {
                fail(std::current_exception());
                return;
            }
        }
    }


    uint64_t HashScheduler::completed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return completed_;
    }


    void HashScheduler::fail(std::exception_ptr e) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!failure_) failure_ = std::move(e);
        }
        doneCv_.notify_all();
        queue_.abort();
    }


    void HashScheduler::rethrowFailure() {
        std::exception_ptr e;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            e = failure_;
        }
        if (e) std::rethrow_exception(e);
    }


    void HashScheduler::joinAll() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }


} // namespace maketorrent::create
