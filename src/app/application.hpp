#pragma once

#include "app/host_frame.hpp"
#include "events/host_event.hpp"

#include <Windows.h>

#include <memory>
#include <string_view>

namespace wh::logging
{
    class Logger;
}

namespace wh::localization
{
    class Localizer;
}

namespace wh::native
{
    class NativeWindows;
}

namespace wh::embedding
{
    class EmbeddingEngine;
}

namespace wh::commands
{
    class CommandSurface;
}

namespace wh::app
{
    class Workspace;

    class Application final : public HostFrameListener, public events::HostEventSink
    {
    public:
        Application();
        ~Application() override;

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        [[nodiscard]] int run();

        void on_resize(int width, int height) noexcept override;
        bool on_accelerator(std::wstring_view accelerator) noexcept override;
        void on_timer(UINT_PTR timer_id) noexcept override;
        void on_closing() noexcept override;

        void emit(const events::HostEventMessage& message) override;

    private:
        [[nodiscard]] int list_windows();

        std::unique_ptr<localization::Localizer> _localizer;
        std::unique_ptr<logging::Logger> _logger;
        std::shared_ptr<native::NativeWindows> _windows;
        std::unique_ptr<embedding::EmbeddingEngine> _engine;
        std::unique_ptr<commands::CommandSurface> _commands;
        std::unique_ptr<Workspace> _workspace;
        std::unique_ptr<HostFrame> _frame;

        int _client_width{ 0 };
        int _client_height{ 0 };
    };
}
