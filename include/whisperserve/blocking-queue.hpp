// blocking-queue.hpp - Blocking Resource Queue
#pragma once

// stl includes
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

// local includes
#include "config.hpp"


namespace whisperserve {

// BlockingQueue ::
// Thread-safe queue of interchangeable resources (decoding states, worker
// slots). `acquire` blocks until one is available.
template <typename T>
class BlockingQueue final {

  public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue &) = delete; // disable copying

    BlockingQueue &operator=(const BlockingQueue &) = delete; // disable assignment

    // friendly alias for `pop`
    inline T acquire() {
        return pop_();
    }

    // friendly alias for `push`
    inline void release(const T &item) {
        push_(item);
    }

    // takes every queued item without waiting
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> items;
        while (!queue_.empty()) {
            items.push_back(queue_.front());
            queue_.pop();
        }
        return items;
    }

  private:
    void push_(const T &item) {
        std::unique_lock<std::mutex> mlock(mutex_);
        queue_.push(item);
        mlock.unlock();
        cond_.notify_one(); // wakes one caller suspended in `pop_`
    }

    T pop_() {
        std::unique_lock<std::mutex> mlock(mutex_);
        // waits until an item is available
        while (queue_.empty()) {
            cond_.wait(mlock);
        }
        auto item = queue_.front();
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;

    std::mutex mutex_;

    std::condition_variable cond_;
};

} // namespace whisperserve
