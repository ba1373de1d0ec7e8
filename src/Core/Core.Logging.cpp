module;

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;
import :Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_LogMutex;
        std::atomic<Level> s_MinLevel{Level::Debug};
        const auto s_StartTime = std::chrono::steady_clock::now();

        struct Style
        {
            const char* Color;
            const char* Label;
        };

        Style StyleFor(Level level)
        {
            switch (level)
            {
            case Level::Debug:   return {"\033[36m", "[DBG] "};
            case Level::Info:    return {"\033[32m", "[INFO]"};
            case Level::Warning: return {"\033[33m", "[WARN]"};
            case Level::Error:   return {"\033[31m", "[ERR] "};
            }
            return {"\033[0m", "[?]   "};
        }
    }

    void SetMinLevel(Level level)
    {
        s_MinLevel.store(level, std::memory_order_relaxed);
    }

    Level GetMinLevel()
    {
        return s_MinLevel.load(std::memory_order_relaxed);
    }

    bool IsEnabled(Level level)
    {
        // Errors are never filtered.
        return level == Level::Error || level >= GetMinLevel();
    }

    void Write(Level level, std::string_view msg)
    {
        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - s_StartTime).count();
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "[+%.3fs]", seconds);

        const Style style = StyleFor(level);

        std::lock_guard lock(s_LogMutex);
        auto& stream = (level == Level::Error) ? std::cerr : std::cout;
        stream << style.Color << stamp << ' ' << style.Label << ' ' << msg << "\033[0m" << std::endl;
    }
}
