// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <fstream>
#include <mutex>
#include <print>

namespace rigchat::log
{

namespace
{
    std::atomic<Level> globalLevel = Level::Info;

    struct Sinks
    {
        std::mutex mutex;
        LogCallback callback;
        std::ofstream file;
        std::deque<std::string> history;
    };

    auto sinks() -> Sinks&
    {
        static auto instance = Sinks {};
        return instance;
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);
    s.callback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto setLogFile(std::string_view path) -> bool
{
    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);
    if (s.file.is_open())
        s.file.close();
    if (path.empty())
        return true;
    s.file.open(std::string(path), std::ios::app);
    return s.file.is_open();
}

auto recent(std::size_t count) -> std::vector<std::string>
{
    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);
    auto const skip = s.history.size() > count ? s.history.size() - count : 0;
    return { s.history.begin() + static_cast<std::ptrdiff_t>(skip), s.history.end() };
}

auto levelPrefix(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto const line = std::format("[{}] {}", levelPrefix(level), message);

    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);

    s.history.push_back(line);
    while (s.history.size() > MaxHistoryLines)
        s.history.pop_front();

    if (s.file.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(s.file, "{:%F %T} {}", now, line);
        s.file.flush();
    }

    if (s.callback)
    {
        s.callback(level, message);
        return;
    }

    std::println(stderr, "{}", line);
}

} // namespace rigchat::log
