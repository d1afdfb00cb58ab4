#ifndef NFCOLLECT_THREAD_SAFE_QUEUE_HPP
#define NFCOLLECT_THREAD_SAFE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace nfcollect {

/**
 * What push() does when a bounded queue is full
 */
enum class OverflowPolicy {
    DROP_NEWEST,  // reject the pushed item
    DROP_OLDEST   // discard the front item to make room
};

/**
 * Bounded thread-safe queue with blocking operations and done flag
 *
 * push() never blocks; overflow is resolved by the policy and counted in
 * dropped(). A capacity of 0 means unbounded.
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity = 0,
                             OverflowPolicy policy = OverflowPolicy::DROP_NEWEST)
        : capacity_(capacity), policy_(policy), done_(false), dropped_(0) {}

    /**
     * Push item to queue
     *
     * @return false if the item was rejected (queue done, or full with
     *         DROP_NEWEST). With DROP_OLDEST the push succeeds and the
     *         oldest item is discarded instead.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_) {
                return false;
            }

            if (capacity_ > 0 && queue_.size() >= capacity_) {
                dropped_++;
                if (policy_ == OverflowPolicy::DROP_NEWEST) {
                    return false;
                }
                queue_.pop_front();
            }

            queue_.push_back(std::move(item));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * Try to pop item from queue with timeout
     * Returns empty optional if timeout expires or queue is done and drained
     */
    std::optional<T> try_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!cond_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || done_;
        })) {
            return std::nullopt;
        }

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /**
     * Pop item from queue (blocking)
     * Returns empty optional once the queue is done and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);

        cond_.wait(lock, [this] {
            return !queue_.empty() || done_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /**
     * Mark queue as done (no more items will be pushed)
     *
     * Items already queued can still be popped.
     */
    void set_done() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cond_.notify_all();
    }

    bool is_done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    /**
     * Items lost to overflow so far
     */
    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    size_t capacity() const { return capacity_; }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    const size_t capacity_;
    const OverflowPolicy policy_;
    bool done_;
    uint64_t dropped_;
};

} // namespace nfcollect

#endif // NFCOLLECT_THREAD_SAFE_QUEUE_HPP
