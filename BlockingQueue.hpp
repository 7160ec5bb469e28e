// BlockingQueue.hpp
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Thread-safe FIFO. Producers push from any thread; one consumer pops.
// After close() pushes are ignored and pop() drains what is left, then
// returns nullopt.
template <typename T>
class BlockingQueue {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                return false;
            }
            queue.push_back(std::move(item));
        }
        cv.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this] { return !queue.empty() || closed; });
        return take_front();
    }

    // nullopt on timeout as well as on a closed, empty queue.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, timeout, [this] { return !queue.empty() || closed; });
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

private:
    std::deque<T> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool closed = false;

    std::optional<T> take_front() {
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop_front();
        return item;
    }
};
