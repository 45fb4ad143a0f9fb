#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <stdexcept>


namespace maketorrent::create {


    /**
     * @brief Bounded blocking queue shared by one producer and a pool of workers.
     *
     * push() blocks while the queue is full, pop() while it is empty.
     * close(): no more pushes; pop() keeps returning queued items, then false.
     * abort(): like close() but queued items are dropped.
     */
    template <typename T>
    class WorkQueue
    {
    public:
        explicit WorkQueue(std::size_t capacity) : capacity_(capacity) {
            if (capacity_ == 0) throw std::invalid_argument("work queue capacity must be positive");
        }

        // false once the queue is closed; the item is not enqueued then
        bool push(T item) {
            std::unique_lock<std::mutex> lock(mtx_);
            notFull_.wait(lock, [this] { return items_.size() < capacity_ || closed_; });
            if (closed_) return false;

            items_.push(std::move(item));
            notEmpty_.notify_one();
            return true;
        }

        bool pop(T& out) {
            std::unique_lock<std::mutex> lock(mtx_);
            notEmpty_.wait(lock, [this] { return !items_.empty() || closed_; });

            if (items_.empty()) {
                return false; // closed and drained
            }

            out = std::move(items_.front());
            items_.pop();
            notFull_.notify_one();
            return true;
        }

        void close() {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
            notEmpty_.notify_all();
            notFull_.notify_all();
        }

        void abort() {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
            std::queue<T>().swap(items_);
            notEmpty_.notify_all();
            notFull_.notify_all();
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return items_.size();
        }

    private:
        std::queue<T> items_;
        const std::size_t capacity_;
        mutable std::mutex mtx_;
        std::condition_variable notEmpty_;
        std::condition_variable notFull_;
        bool closed_ = false;
    };


} // namespace maketorrent::create
