// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace rigchat
{

/// @brief Unbounded multi-producer queue drained by a single consumer loop.
template <typename T>
class Channel
{
  public:
    /// @brief Enqueues a value and wakes the consumer.
    void post(T value)
    {
        {
            auto lock = std::lock_guard(_mutex);
            _queue.push_back(std::move(value));
        }
        _cv.notify_one();
    }

    /// @brief Waits up to @p timeout for at least one value, then takes everything queued.
    [[nodiscard]] auto drain(std::chrono::milliseconds timeout) -> std::vector<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return !_queue.empty(); });
        auto values = std::vector<T> {};
        values.reserve(_queue.size());
        for (auto& value: _queue)
            values.push_back(std::move(value));
        _queue.clear();
        return values;
    }

    /// @brief Takes the oldest value without waiting.
    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        if (_queue.empty())
            return std::nullopt;
        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    [[nodiscard]] auto empty() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.empty();
    }

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<T> _queue;
};

} // namespace rigchat
