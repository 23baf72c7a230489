#pragma once

#include <optional>
#include <string_view>

namespace wh::logging
{
    enum class LogLevel
    {
        trace = 0,
        debug = 1,
        info = 2,
        warning = 3,
        error = 4,
    };

    // Tag written into every log line.
    [[nodiscard]] constexpr std::wstring_view level_name(const LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::trace:
            return L"TRACE";
        case LogLevel::debug:
            return L"DEBUG";
        case LogLevel::info:
            return L"INFO";
        case LogLevel::warning:
            return L"WARN";
        case LogLevel::error:
            return L"ERROR";
        }
        return L"UNKNOWN";
    }

    // Config spelling; `std::nullopt` for anything else.
    [[nodiscard]] constexpr std::optional<LogLevel> parse_log_level(const std::wstring_view text) noexcept
    {
        if (text == L"trace")
        {
            return LogLevel::trace;
        }
        if (text == L"debug")
        {
            return LogLevel::debug;
        }
        if (text == L"info")
        {
            return LogLevel::info;
        }
        if (text == L"warning")
        {
            return LogLevel::warning;
        }
        if (text == L"error")
        {
            return LogLevel::error;
        }
        return std::nullopt;
    }
}
