#pragma once
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "types.hpp"
#include "work_queue.hpp"
#include "../../logger/logger.hpp"


namespace maketorrent::create {


    /**
     * @brief Hashes pieces on a fixed pool of worker threads.
     *
     * Pieces must be submitted in index order 0..expectedPieces-1. Workers may finish in
     * any order; each result lands in the slot of its own index, so collect() returns the
     * hashes in piece order regardless of scheduling. At most 2 * workers pieces wait in
     * the queue, submit() blocks beyond that.
     *
     * The first worker failure aborts the pool and is rethrown from the next submit() or
     * from collect(). Destroying the scheduler without collect() abandons queued work.
     */
    class HashScheduler
    {
    public:
        // (pieces hashed so far, expected pieces); called from worker threads
        using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

        explicit HashScheduler(uint64_t expectedPieces,
                               unsigned workers = 0,
                               logger::LoggerPtr log = nullptr,
                               ProgressCallback progress = nullptr);
        ~HashScheduler();

        HashScheduler(const HashScheduler&) = delete;
        HashScheduler& operator=(const HashScheduler&) = delete;

        void submit(Piece piece);

        // Waits for every submitted piece. Throws std::logic_error unless exactly
        // expectedPieces were submitted.
        std::vector<metainfo::PieceHash> collect();

        unsigned workers() const noexcept { return static_cast<unsigned>(threads_.size()); }
        uint64_t completed() const;

        static unsigned defaultWorkers() noexcept;

    private:
        void workerLoop();
        void fail(std::exception_ptr e);
        void rethrowFailure();
        void joinAll();

        const uint64_t expected_;
        logger::LoggerPtr log_;
        ProgressCallback progress_;

        WorkQueue<Piece> queue_;
        std::vector<metainfo::PieceHash> results_;     // slot i written only by the worker hashing piece i
        std::vector<std::thread> threads_;

        uint64_t submitted_{0};
        bool collected_{false};

        mutable std::mutex mtx_;            // guards completed_ and failure_
        std::condition_variable doneCv_;
        uint64_t completed_{0};
        std::exception_ptr failure_;
    };


} // namespace maketorrent::create
