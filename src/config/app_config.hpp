#pragma once

#include "logging/log_level.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace wh::config
{
    struct ConfigError final
    {
        std::wstring message;
        DWORD win32_error{ ERROR_SUCCESS };
    };

    struct AppConfig final
    {
        wh::logging::LogLevel minimum_log_level{ wh::logging::LogLevel::info };
        std::wstring locale_override;
        bool enable_debug_sink{ true };
        bool enable_file_logging{ false };
        // Empty selects `%TEMP%\windowhub`.
        std::wstring log_directory;
        std::wstring product_name{ L"WindowHub" };
        DWORD focus_detach_delay_ms{ 100 };
        int min_window_width{ 100 };
        int min_window_height{ 100 };
        int content_top_offset{ 40 };
        DWORD validity_poll_ms{ 500 };
    };

    class ConfigLoader final
    {
    public:
        // File named by `WINDOWHUB_CONFIG` (optional), then `WINDOWHUB_*`
        // environment overrides.
        [[nodiscard]] static std::expected<AppConfig, ConfigError> load() noexcept;
        [[nodiscard]] static std::expected<AppConfig, ConfigError> parse_text(std::wstring_view text) noexcept;
    };
}
