#include "logging/logger.hpp"

#include <Windows.h>

#include <memory>
#include <string>

namespace
{
    class TestSink final : public wh::logging::ILogSink
    {
    public:
        void write(const std::wstring_view line) noexcept override
        {
            captured = std::wstring{ line };
            ++writes;
        }

        std::wstring captured;
        int writes{ 0 };
    };

    bool test_level_filtering()
    {
        auto sink = std::make_shared<TestSink>();
        wh::logging::Logger logger(wh::logging::LogLevel::warning);
        logger.add_sink(sink);

        logger.log(wh::logging::LogLevel::info, L"this should be filtered");
        if (sink->writes != 0)
        {
            return false;
        }

        logger.log(wh::logging::LogLevel::error, L"window 0x{:X} {}", 0x2A0Bu, L"failed");
        return sink->writes == 1 &&
               sink->captured.find(L"[ERROR]") != std::wstring::npos &&
               sink->captured.find(L"window 0x2A0B failed") != std::wstring::npos;
    }

    bool test_level_can_change_after_startup()
    {
        auto sink = std::make_shared<TestSink>();
        wh::logging::Logger logger(wh::logging::LogLevel::info);
        logger.add_sink(sink);

        logger.set_minimum_level(wh::logging::LogLevel::trace);
        logger.log(wh::logging::LogLevel::trace, L"tracing");
        return logger.minimum_level() == wh::logging::LogLevel::trace &&
               sink->writes == 1 &&
               sink->captured.find(L"[TRACE]") != std::wstring::npos;
    }

    bool test_logger_without_sinks_is_disabled()
    {
        const wh::logging::Logger logger(wh::logging::LogLevel::trace);
        return !logger.enabled(wh::logging::LogLevel::error);
    }

    bool test_parse_log_level()
    {
        return wh::logging::parse_log_level(L"warning") == wh::logging::LogLevel::warning &&
               wh::logging::parse_log_level(L"trace") == wh::logging::LogLevel::trace &&
               !wh::logging::parse_log_level(L"WARN") &&
               !wh::logging::parse_log_level(L"") &&
               wh::logging::level_name(wh::logging::LogLevel::warning) == L"WARN";
    }

    bool test_file_sink_create()
    {
        const auto sink = wh::logging::FileLogSink::create(L"windowhub_logger_test.log");
        if (!sink)
        {
            return false;
        }

        sink.value()->write(L"logger file sink smoke");
        ::DeleteFileW(L"windowhub_logger_test.log");
        return true;
    }

    bool test_default_file_sink_path()
    {
        const auto resolved = wh::logging::FileLogSink::resolve_default_log_path();
        if (!resolved || resolved->empty())
        {
            return false;
        }

        const size_t last_separator = resolved->find_last_of(L"\\/");
        if (last_separator == std::wstring::npos || last_separator + 1 >= resolved->size())
        {
            return false;
        }

        const std::wstring file_name = resolved->substr(last_separator + 1);
        const std::wstring expected_prefix = L"windowhub_" + std::to_wstring(::GetCurrentProcessId()) + L"_";
        if (!file_name.starts_with(expected_prefix) || !file_name.ends_with(L".log"))
        {
            return false;
        }

        {
            const auto sink = wh::logging::FileLogSink::create(*resolved);
            if (!sink)
            {
                return false;
            }

            sink.value()->write(L"default file sink path smoke");
        }
        return ::DeleteFileW(resolved->c_str()) != FALSE;
    }

    bool test_empty_log_directory_rejected()
    {
        const auto resolved = wh::logging::FileLogSink::resolve_log_path(L"");
        return !resolved && resolved.error() == ERROR_INVALID_PARAMETER;
    }
}

bool run_logger_tests()
{
    return test_level_filtering() &&
           test_level_can_change_after_startup() &&
           test_logger_without_sinks_is_disabled() &&
           test_parse_log_level() &&
           test_file_sink_create() &&
           test_default_file_sink_path() &&
           test_empty_log_directory_rejected();
}
