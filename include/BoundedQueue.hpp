#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// Mutex guarded FIFO with a fixed capacity. A push into a full queue drops the oldest entry.
template <typename T>
class BoundedQueue
{
private:
    std::deque<T> _queue;
    std::size_t _capacity;
    mutable std::mutex _queue_mutex;
    std::condition_variable _not_empty;
    std::atomic<uint64_t> _dropped_count;

public:
    explicit BoundedQueue(const std::size_t capacity) : _capacity(capacity), _dropped_count(0) {}
    ~BoundedQueue() = default;
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false when an older entry had to be dropped
    bool push(T item)
    {
        bool dropped = false;
        {
            std::lock_guard lock(_queue_mutex);
            if (_capacity == 0)
            {
                _dropped_count++;
                return false;
            }
            if (_queue.size() >= _capacity)
            {
                _queue.pop_front();
                _dropped_count++;
                dropped = true;
            }
            _queue.push_back(std::move(item));
        }
        _not_empty.notify_one();
        return !dropped;
    }

    std::optional<T> pop(const std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(_queue_mutex);
        if (!_not_empty.wait_for(lock, timeout, [this] { return !_queue.empty(); }))
        {
            return std::nullopt;
        }
        T item = std::move(_queue.front());
        _queue.pop_front();
        return item;
    }

    std::vector<T> drain()
    {
        std::vector<T> items;
        std::lock_guard lock(_queue_mutex);
        items.reserve(_queue.size());
        for (auto& item : _queue)
        {
            items.push_back(std::move(item));
        }
        _queue.clear();
        return items;
    }

    std::size_t size() const
    {
        std::lock_guard lock(_queue_mutex);
        return _queue.size();
    }

    std::size_t capacity() const { return _capacity; }

    uint64_t droppedCount() const { return _dropped_count.load(); }
};
