#pragma once

// Top-level host frame: the container every embedded window is reparented
// into. Owns the window class, the frame window and the message pump; all
// behavior is delegated to a `HostFrameListener`.

#include "core/exception.hpp"
#include "core/window_handle.hpp"

#include <Windows.h>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace wh::app
{
    class HostFrameListener
    {
    public:
        virtual ~HostFrameListener() = default;

        // Client-area size in pixels.
        virtual void on_resize(int width, int height) noexcept = 0;

        // `accelerator` uses the `events::parse_shortcut` grammar. Returns
        // true when the key was consumed.
        virtual bool on_accelerator(std::wstring_view accelerator) noexcept = 0;

        virtual void on_timer(UINT_PTR timer_id) noexcept = 0;

        // Sent once before the frame (and with it every child) is destroyed.
        virtual void on_closing() noexcept = 0;
    };

    struct HostFrameConfig final
    {
        std::wstring title;
        int initial_width_px{ 1200 };
        int initial_height_px{ 800 };
        int show_command{ SW_SHOWDEFAULT };
    };

    class HostFrame final
    {
    public:
        [[nodiscard]] static std::expected<std::unique_ptr<HostFrame>, core::Win32Error> create(
            HostFrameConfig config,
            HostFrameListener& listener) noexcept;

        HostFrame(const HostFrame&) = delete;
        HostFrame& operator=(const HostFrame&) = delete;
        HostFrame(HostFrame&&) = delete;
        HostFrame& operator=(HostFrame&&) = delete;

        ~HostFrame() noexcept;

        // Runs the message pump until the frame is closed. Throws
        // `core::Win32Error` when the pump itself fails.
        [[nodiscard]] int run();

        [[nodiscard]] bool start_timer(UINT_PTR timer_id, UINT interval_ms) noexcept;

        void toggle_visibility() noexcept;

        [[nodiscard]] core::WindowHandle handle() const noexcept;

        [[nodiscard]] static LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam) noexcept;

    private:
        HostFrame(HostFrameConfig config, HostFrameListener& listener) noexcept;

        [[nodiscard]] bool create_window() noexcept;

        [[nodiscard]] LRESULT handle_message(UINT msg, WPARAM wparam, LPARAM lparam) noexcept;
        [[nodiscard]] bool handle_key_down(WPARAM virtual_key) noexcept;

        HostFrameConfig _config;
        HostFrameListener& _listener;
        HWND _hwnd{};
        bool _closing{ false };
    };
}
