#pragma once

#include "core/unique_resource.hpp"
#include "logging/log_level.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace wh::logging
{
    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;
        virtual void write(std::wstring_view line) noexcept = 0;
    };

    class DebugOutputSink final : public ILogSink
    {
    public:
        void write(std::wstring_view line) noexcept override;
    };

    class FileLogSink final : public ILogSink
    {
    public:
        [[nodiscard]] static std::expected<std::shared_ptr<FileLogSink>, DWORD> create(std::wstring path) noexcept;

        // `<directory>\windowhub_<pid>_<process start time>.log`; the
        // directory is created when missing.
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_log_path(std::wstring directory_path) noexcept;

        // Same as `resolve_log_path` rooted at `%TEMP%\windowhub`.
        [[nodiscard]] static std::expected<std::wstring, DWORD> resolve_default_log_path() noexcept;

        void write(std::wstring_view line) noexcept override;

    private:
        explicit FileLogSink(core::UniqueHandle file_handle) noexcept;

        core::UniqueHandle _file_handle;
        std::mutex _write_lock;
        bool _utf8_bom_written{ false };
    };

    // Commands arrive on the UI thread while focus hand-offs and tests may log
    // from other threads. Sinks are registered during startup only; after
    // that the sink list is read-only and `log` may be called concurrently.
    class Logger final
    {
    public:
        explicit Logger(LogLevel minimum_level);

        void add_sink(std::shared_ptr<ILogSink> sink);
        void set_minimum_level(LogLevel level) noexcept;
        [[nodiscard]] LogLevel minimum_level() const noexcept;
        [[nodiscard]] bool enabled(LogLevel level) const noexcept;

        template<typename... Args>
        void log(const LogLevel level, const std::wformat_string<Args...> format_text, Args&&... args)
        {
            if (!enabled(level))
            {
                return;
            }

            const std::wstring body = std::format(format_text, std::forward<Args>(args)...);
            log_preformatted(level, body);
        }

        void log_preformatted(LogLevel level, std::wstring_view body);

    private:
        static std::wstring build_timestamped_line(LogLevel level, std::wstring_view body);

        std::atomic<LogLevel> _minimum_level;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };
}
