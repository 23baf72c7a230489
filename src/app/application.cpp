#include "app/application.hpp"

#include "app/workspace.hpp"
#include "cli/host_arguments.hpp"
#include "commands/command_surface.hpp"
#include "config/app_config.hpp"
#include "core/error_output.hpp"
#include "embedding/embedding_engine.hpp"
#include "embedding/input_detach_scheduler.hpp"
#include "localization/localizer.hpp"
#include "logging/logger.hpp"
#include "native/win32_native_windows.hpp"

#include <Windows.h>

#include <expected>
#include <new>
#include <string>

// Top-level orchestration for the executable:
// config -> localization -> logging -> CLI parse -> host frame ->
// engine/command surface -> startup embeds -> message pump.
//
// Window-manager details stay in `native`, embedding rules in `embedding`.

namespace wh::app
{
    namespace
    {
        constexpr UINT_PTR k_validity_timer_id = 1;

        void write_localized_error(const localization::Localizer& localizer, const localization::StringId id, const std::wstring_view detail)
        {
            std::wstring message(localizer.text(id));
            message.append(L": ");
            message.append(detail);
            core::write_error_line(message);
        }

        void add_file_sink(logging::Logger& logger, const config::AppConfig& config)
        {
            std::expected<std::wstring, DWORD> resolved_path = config.log_directory.empty()
                ? logging::FileLogSink::resolve_default_log_path()
                : logging::FileLogSink::resolve_log_path(config.log_directory);
            if (!resolved_path)
            {
                logger.log(
                    logging::LogLevel::warning,
                    L"File logging disabled; path resolution failed with error={}",
                    resolved_path.error());
                return;
            }

            auto file_sink = logging::FileLogSink::create(resolved_path.value());
            if (!file_sink)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; CreateFileW error={}", file_sink.error());
                return;
            }

            logger.add_sink(file_sink.value());
            logger.log(logging::LogLevel::info, L"File logging enabled at {}", resolved_path.value());
        }
    }

    Application::Application() = default;

    Application::~Application() = default;

    int Application::run()
    {
        auto config_result = config::ConfigLoader::load();
        if (!config_result)
        {
            localization::Localizer fallback_localizer(L"en-US");
            write_localized_error(fallback_localizer, localization::StringId::config_failed, config_result.error().message);
            return static_cast<int>(ERROR_BAD_CONFIGURATION);
        }

        const config::AppConfig config = std::move(config_result.value());
        _localizer = std::make_unique<localization::Localizer>(config.locale_override);

        _logger = std::make_unique<logging::Logger>(config.minimum_log_level);
        if (config.enable_debug_sink)
        {
            _logger->add_sink(std::make_shared<logging::DebugOutputSink>());
        }
        if (config.enable_file_logging)
        {
            add_file_sink(*_logger, config);
        }

        const std::wstring startup_command_line = ::GetCommandLineW();
        _logger->log(logging::LogLevel::info, L"Startup context: pid={}, command_line={}", ::GetCurrentProcessId(), startup_command_line);
        _logger->log(logging::LogLevel::info, L"{}", _localizer->text(localization::StringId::startup));
        _logger->log(logging::LogLevel::debug, L"Locale selected: {}", _localizer->locale());

        auto parsed_args = cli::HostArguments::parse(startup_command_line);
        if (!parsed_args)
        {
            _logger->log(logging::LogLevel::error, L"Parse error: {}", parsed_args.error().message);
            write_localized_error(*_localizer, localization::StringId::parse_failed, parsed_args.error().message);
            return static_cast<int>(ERROR_INVALID_PARAMETER);
        }
        const cli::HostArguments args = std::move(parsed_args.value());

        _windows = std::make_shared<native::Win32NativeWindows>();
        _engine = std::make_unique<embedding::EmbeddingEngine>(
            _windows,
            std::make_shared<embedding::ThreadInputDetachScheduler>(_windows),
            *_logger,
            embedding::EngineOptions{ .focus_detach_delay_ms = config.focus_detach_delay_ms });
        _commands = std::make_unique<commands::CommandSurface>(
            *_engine,
            *_localizer,
            embedding::EnumerationPolicy{
                .product_name = config.product_name,
                .min_width = config.min_window_width,
                .min_height = config.min_window_height,
            },
            this);

        if (args.list_requested())
        {
            return list_windows();
        }

        const int top_offset = args.top_offset().value_or(config.content_top_offset);
        _workspace = std::make_unique<Workspace>(*_commands, *_logger, top_offset);

        auto frame = HostFrame::create(HostFrameConfig{ .title = config.product_name }, *this);
        if (!frame)
        {
            const DWORD error = core::to_dword(frame.error());
            _logger->log(logging::LogLevel::error, L"Host frame creation failed. error={}", error);
            write_localized_error(*_localizer, localization::StringId::host_frame_failed, std::to_wstring(error));
            return static_cast<int>(error == 0 ? ERROR_GEN_FAILURE : error);
        }
        _frame = std::move(frame.value());
        _engine->set_host_frame(_frame->handle());
        _workspace->resize(_client_width, _client_height);

        for (const core::WindowHandle window : args.windows_to_embed())
        {
            if (auto opened = _workspace->open_tab(window.as_uintptr()); !opened)
            {
                _logger->log(
                    logging::LogLevel::warning,
                    L"{} 0x{:X}: [{}] {}",
                    _localizer->text(localization::StringId::embed_at_startup_failed),
                    window.as_uintptr(),
                    embedding::to_string(opened.error().kind),
                    opened.error().message);
            }
        }

        if (!_frame->start_timer(k_validity_timer_id, config.validity_poll_ms))
        {
            _logger->log(logging::LogLevel::warning, L"Validity polling disabled; SetTimer error={}", ::GetLastError());
        }

        const int exit_code = _frame->run();
        _logger->log(logging::LogLevel::info, L"{}", _localizer->text(localization::StringId::shutdown));
        return exit_code;
    }

    int Application::list_windows()
    {
        auto listed = _commands->enumerate_windows();
        if (!listed)
        {
            _logger->log(logging::LogLevel::error, L"Enumeration failed: {}", listed.error().message);
            return static_cast<int>(ERROR_GEN_FAILURE);
        }

        for (const auto& descriptor : listed.value())
        {
            _logger->log(
                logging::LogLevel::info,
                L"0x{:X} {}x{} [{}] {}",
                descriptor.window.as_uintptr(),
                descriptor.width,
                descriptor.height,
                descriptor.class_name,
                descriptor.title);
        }
        _logger->log(logging::LogLevel::info, L"{} candidate window(s)", listed->size());
        return 0;
    }

    void Application::on_resize(const int width, const int height) noexcept
    {
        _client_width = width;
        _client_height = height;
        if (!_workspace)
        {
            return;
        }

        try
        {
            _workspace->resize(width, height);
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] out of memory during layout\n");
        }
    }

    bool Application::on_accelerator(const std::wstring_view accelerator) noexcept
    {
        const auto message = events::parse_shortcut(accelerator);
        if (!message || !_commands)
        {
            return false;
        }

        try
        {
            if (auto emitted = _commands->emit_event(*message); !emitted)
            {
                _logger->log(logging::LogLevel::warning, L"Shortcut {} dropped: {}", accelerator, emitted.error().message);
                return false;
            }
            return true;
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] out of memory while handling a shortcut\n");
            return false;
        }
    }

    void Application::on_timer(const UINT_PTR timer_id) noexcept
    {
        if (timer_id != k_validity_timer_id || !_workspace)
        {
            return;
        }

        try
        {
            _workspace->poll_validity();
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] out of memory during validity poll\n");
        }
    }

    void Application::on_closing() noexcept
    {
        if (!_workspace)
        {
            return;
        }

        try
        {
            _workspace->release_all();
            // Windows embedded through the command surface without a tab.
            _engine->release_all();
        }
        catch (const std::bad_alloc&)
        {
            ::OutputDebugStringW(L"[windowhub] out of memory during shutdown release\n");
        }
    }

    void Application::emit(const events::HostEventMessage& message)
    {
        _logger->log(logging::LogLevel::debug, L"Host event {} (tab {})", events::wire_name(message.event), message.tab_index);

        if (_workspace && _workspace->handle(message))
        {
            return;
        }

        switch (message.event)
        {
        case events::HostEvent::toggle_visibility:
            if (_frame)
            {
                _frame->toggle_visibility();
            }
            break;
        case events::HostEvent::open_search:
            _logger->log(logging::LogLevel::info, L"Search requested over {} open tab(s)", _workspace ? _workspace->tabs().size() : 0);
            break;
        default:
            break;
        }
    }
}
