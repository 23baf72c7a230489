#include "logging/logger.hpp"

#include "core/assert.hpp"
#include "core/environment.hpp"

#include <new>
#include <optional>
#include <vector>

namespace wh::logging
{
    namespace
    {
        constexpr std::wstring_view k_log_directory_name = L"windowhub";
        constexpr std::wstring_view k_log_file_prefix = L"windowhub_";

        [[nodiscard]] std::expected<ULONGLONG, DWORD> query_process_start_time() noexcept
        {
            FILETIME creation_time{};
            FILETIME exit_time{};
            FILETIME kernel_time{};
            FILETIME user_time{};
            if (::GetProcessTimes(
                    ::GetCurrentProcess(),
                    &creation_time,
                    &exit_time,
                    &kernel_time,
                    &user_time) == FALSE)
            {
                return std::unexpected(::GetLastError());
            }

            ULARGE_INTEGER value{};
            value.LowPart = creation_time.dwLowDateTime;
            value.HighPart = creation_time.dwHighDateTime;
            return value.QuadPart;
        }

        [[nodiscard]] std::expected<void, DWORD> ensure_directory_exists(const std::wstring& path) noexcept
        {
            if (::CreateDirectoryW(path.c_str(), nullptr) != FALSE)
            {
                return {};
            }

            const DWORD error = ::GetLastError();
            if (error != ERROR_ALREADY_EXISTS)
            {
                return std::unexpected(error);
            }

            const DWORD attributes = ::GetFileAttributesW(path.c_str());
            if (attributes == INVALID_FILE_ATTRIBUTES)
            {
                return std::unexpected(::GetLastError());
            }
            if ((attributes & FILE_ATTRIBUTE_DIRECTORY) == 0)
            {
                return std::unexpected(ERROR_DIRECTORY);
            }

            return {};
        }

        [[nodiscard]] std::vector<char> to_utf8(const std::wstring_view text)
        {
            const int required = ::WideCharToMultiByte(
                CP_UTF8,
                0,
                text.data(),
                static_cast<int>(text.size()),
                nullptr,
                0,
                nullptr,
                nullptr);
            if (required <= 0)
            {
                return {};
            }

            std::vector<char> utf8(static_cast<size_t>(required));
            const int converted = ::WideCharToMultiByte(
                CP_UTF8,
                0,
                text.data(),
                static_cast<int>(text.size()),
                utf8.data(),
                required,
                nullptr,
                nullptr);
            if (converted <= 0)
            {
                return {};
            }
            return utf8;
        }
    }

    void DebugOutputSink::write(const std::wstring_view line) noexcept
    {
        try
        {
            std::wstring with_newline{ line };
            with_newline.push_back(L'\n');
            ::OutputDebugStringW(with_newline.c_str());
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] log line dropped (out of memory)\n");
        }
    }

    FileLogSink::FileLogSink(core::UniqueHandle file_handle) noexcept :
        _file_handle(std::move(file_handle))
    {
    }

    std::expected<std::shared_ptr<FileLogSink>, DWORD> FileLogSink::create(std::wstring path) noexcept
    {
        core::UniqueHandle file(::CreateFileW(
            path.c_str(),
            FILE_APPEND_DATA,
            FILE_SHARE_READ,
            nullptr,
            OPEN_ALWAYS,
            FILE_ATTRIBUTE_NORMAL,
            nullptr));
        if (!file.valid())
        {
            return std::unexpected(::GetLastError());
        }

        try
        {
            return std::shared_ptr<FileLogSink>(new FileLogSink(std::move(file)));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_log_path(std::wstring directory_path) noexcept
    {
        if (directory_path.empty())
        {
            return std::unexpected(static_cast<DWORD>(ERROR_INVALID_PARAMETER));
        }

        if (auto ensured = ensure_directory_exists(directory_path); !ensured)
        {
            return std::unexpected(ensured.error());
        }

        const auto start_time = query_process_start_time();
        if (!start_time)
        {
            return std::unexpected(start_time.error());
        }

        try
        {
            std::wstring file_name(k_log_file_prefix);
            file_name.append(std::to_wstring(::GetCurrentProcessId()));
            file_name.push_back(L'_');
            file_name.append(std::to_wstring(*start_time));
            file_name.append(L".log");
            return core::append_path_component(std::move(directory_path), file_name);
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::resolve_default_log_path() noexcept
    {
        std::wstring directory;
        try
        {
            const std::optional<std::wstring> temp_root = core::temp_directory();
            if (!temp_root)
            {
                return std::unexpected(static_cast<DWORD>(ERROR_ENVVAR_NOT_FOUND));
            }
            directory = core::append_path_component(*temp_root, k_log_directory_name);
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }

        return resolve_log_path(std::move(directory));
    }

    void FileLogSink::write(const std::wstring_view line) noexcept
    {
        if (!_file_handle.valid())
        {
            return;
        }

        std::vector<char> utf8;
        try
        {
            std::wstring payload(line);
            payload.append(L"\r\n");
            utf8 = to_utf8(payload);
        }
        catch (const std::bad_alloc&)
        {
            return;
        }
        if (utf8.empty())
        {
            return;
        }

        std::lock_guard lock(_write_lock);
        DWORD written = 0;
        if (!_utf8_bom_written)
        {
            LARGE_INTEGER position{};
            if (::SetFilePointerEx(_file_handle.get(), {}, &position, FILE_CURRENT) != FALSE && position.QuadPart == 0)
            {
                static constexpr unsigned char utf8_bom[] = { 0xEF, 0xBB, 0xBF };
                ::WriteFile(_file_handle.get(), utf8_bom, static_cast<DWORD>(sizeof(utf8_bom)), &written, nullptr);
            }
            _utf8_bom_written = true;
        }

        ::WriteFile(
            _file_handle.get(),
            utf8.data(),
            static_cast<DWORD>(utf8.size()),
            &written,
            nullptr);
    }

    Logger::Logger(const LogLevel minimum_level) :
        _minimum_level(minimum_level)
    {
    }

    void Logger::add_sink(std::shared_ptr<ILogSink> sink)
    {
        WH_ASSERT(sink != nullptr);
        _sinks.push_back(std::move(sink));
    }

    void Logger::set_minimum_level(const LogLevel level) noexcept
    {
        _minimum_level.store(level, std::memory_order_relaxed);
    }

    LogLevel Logger::minimum_level() const noexcept
    {
        return _minimum_level.load(std::memory_order_relaxed);
    }

    bool Logger::enabled(const LogLevel level) const noexcept
    {
        return level >= _minimum_level.load(std::memory_order_relaxed) && !_sinks.empty();
    }

    void Logger::log_preformatted(const LogLevel level, const std::wstring_view body)
    {
        if (!enabled(level))
        {
            return;
        }

        const std::wstring line = build_timestamped_line(level, body);
        for (const auto& sink : _sinks)
        {
            sink->write(line);
        }
    }

    std::wstring Logger::build_timestamped_line(const LogLevel level, const std::wstring_view body)
    {
        SYSTEMTIME local_time{};
        ::GetLocalTime(&local_time);

        return std::format(
            L"{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] [tid {}] {}",
            local_time.wYear,
            local_time.wMonth,
            local_time.wDay,
            local_time.wHour,
            local_time.wMinute,
            local_time.wSecond,
            local_time.wMilliseconds,
            level_name(level),
            ::GetCurrentThreadId(),
            body);
    }
}
