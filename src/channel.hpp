#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Many producers, one consumer. Once closed, pushes are dropped and waiting
// consumers are released.
template <typename T>
class ResultChannel {
public:
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (closed) return false;
            items.push_back(std::move(value));
        }
        cv.notify_one();
        return true;
    }

    std::optional<T> pop_wait() {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return closed || !items.empty(); });
        return take_locked();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mtx);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            closed = true;
            items.clear();
        }
        cv.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (closed || items.empty()) return std::nullopt;
        T value = std::move(items.front());
        items.pop_front();
        return value;
    }

    std::deque<T> items;
    std::mutex mtx;
    std::condition_variable cv;
    bool closed = false;
};
