module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    // Ordered by severity; SetMinLevel drops everything below the threshold.
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    // Serialized sink: "[+12.345s] [WARN] message", colored per level.
    void Write(Level level, std::string_view msg);

    template <typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Info)) Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Warning)) Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Compiled out under NDEBUG.
    template <typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Debug)) Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
