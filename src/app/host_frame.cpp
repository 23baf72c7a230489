#include "app/host_frame.hpp"

#include "events/host_event.hpp"

#include <algorithm>
#include <new>

namespace wh::app
{
    namespace
    {
        constexpr wchar_t k_window_class_name[] = L"WindowHubHostFrame";

        [[nodiscard]] ATOM register_window_class() noexcept
        {
            WNDCLASSEXW wc{};
            wc.cbSize = sizeof(wc);
            wc.style = CS_HREDRAW | CS_VREDRAW;
            wc.lpfnWndProc = &HostFrame::window_proc;
            wc.hInstance = ::GetModuleHandleW(nullptr);
            wc.hCursor = ::LoadCursorW(nullptr, IDC_ARROW);
            wc.hbrBackground = reinterpret_cast<HBRUSH>(COLOR_WINDOW + 1);
            wc.lpszClassName = k_window_class_name;

            return ::RegisterClassExW(&wc);
        }

        [[nodiscard]] bool is_key_down(const int virtual_key) noexcept
        {
            return (::GetKeyState(virtual_key) & 0x8000) != 0;
        }
    }

    HostFrame::HostFrame(HostFrameConfig config, HostFrameListener& listener) noexcept :
        _config(std::move(config)),
        _listener(listener)
    {
    }

    HostFrame::~HostFrame() noexcept
    {
        if (_hwnd != nullptr)
        {
            ::DestroyWindow(_hwnd);
            _hwnd = nullptr;
        }
    }

    std::expected<std::unique_ptr<HostFrame>, core::Win32Error> HostFrame::create(
        HostFrameConfig config,
        HostFrameListener& listener) noexcept
    {
        if (config.title.empty())
        {
            config.title = L"WindowHub";
        }

        try
        {
            auto frame = std::unique_ptr<HostFrame>(new HostFrame(std::move(config), listener));
            if (!frame->create_window())
            {
                return std::unexpected(core::from_dword(::GetLastError()));
            }
            return frame;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(core::from_dword(ERROR_OUTOFMEMORY));
        }
    }

    bool HostFrame::create_window() noexcept
    {
        static ATOM atom = 0;
        if (atom == 0)
        {
            atom = register_window_class();
            if (atom == 0 && ::GetLastError() == ERROR_CLASS_ALREADY_EXISTS)
            {
                // Only the class name is used below; the atom guards repeat
                // registration.
                atom = 1;
            }
        }

        if (atom == 0)
        {
            return false;
        }

        const int width = std::max(1, _config.initial_width_px);
        const int height = std::max(1, _config.initial_height_px);

        // Clip children so embedded panes are not painted over by the frame.
        _hwnd = ::CreateWindowExW(
            0,
            k_window_class_name,
            _config.title.c_str(),
            WS_OVERLAPPEDWINDOW | WS_CLIPCHILDREN,
            CW_USEDEFAULT,
            CW_USEDEFAULT,
            width,
            height,
            nullptr,
            nullptr,
            ::GetModuleHandleW(nullptr),
            this);
        if (_hwnd == nullptr)
        {
            return false;
        }

        ::ShowWindow(_hwnd, _config.show_command);
        ::UpdateWindow(_hwnd);
        return true;
    }

    int HostFrame::run()
    {
        if (_hwnd == nullptr)
        {
            return static_cast<int>(ERROR_INVALID_WINDOW_HANDLE);
        }

        MSG msg{};
        while (true)
        {
            const BOOL result = ::GetMessageW(&msg, nullptr, 0, 0);
            if (result == 0)
            {
                break;
            }
            if (result == -1)
            {
                core::throw_last_error();
            }

            ::TranslateMessage(&msg);
            ::DispatchMessageW(&msg);
        }

        return static_cast<int>(msg.wParam);
    }

    bool HostFrame::start_timer(const UINT_PTR timer_id, const UINT interval_ms) noexcept
    {
        if (_hwnd == nullptr)
        {
            return false;
        }
        return ::SetTimer(_hwnd, timer_id, interval_ms, nullptr) != 0;
    }

    void HostFrame::toggle_visibility() noexcept
    {
        if (_hwnd == nullptr)
        {
            return;
        }

        if (::IsWindowVisible(_hwnd) != FALSE && ::IsIconic(_hwnd) == FALSE)
        {
            ::ShowWindow(_hwnd, SW_HIDE);
            return;
        }

        ::ShowWindow(_hwnd, SW_RESTORE);
        (void)::SetForegroundWindow(_hwnd);
    }

    core::WindowHandle HostFrame::handle() const noexcept
    {
        return core::WindowHandle(_hwnd);
    }

    LRESULT CALLBACK HostFrame::window_proc(const HWND hwnd, const UINT msg, const WPARAM wparam, const LPARAM lparam) noexcept
    {
        if (msg == WM_NCCREATE)
        {
            const auto* create = reinterpret_cast<const CREATESTRUCTW*>(lparam);
            auto* self = static_cast<HostFrame*>(create->lpCreateParams);
            ::SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(self));
            self->_hwnd = hwnd;
        }

        auto* self = reinterpret_cast<HostFrame*>(::GetWindowLongPtrW(hwnd, GWLP_USERDATA));
        if (self != nullptr)
        {
            return self->handle_message(msg, wparam, lparam);
        }

        return ::DefWindowProcW(hwnd, msg, wparam, lparam);
    }

    bool HostFrame::handle_key_down(const WPARAM virtual_key) noexcept
    {
        try
        {
            const auto accelerator = events::format_accelerator(
                static_cast<UINT>(virtual_key),
                is_key_down(VK_CONTROL),
                is_key_down(VK_SHIFT),
                is_key_down(VK_MENU));
            if (!accelerator)
            {
                return false;
            }
            return _listener.on_accelerator(*accelerator);
        }
        catch (const std::bad_alloc&)
        {
            return false;
        }
    }

    LRESULT HostFrame::handle_message(const UINT msg, const WPARAM wparam, const LPARAM lparam) noexcept
    {
        switch (msg)
        {
        case WM_SIZE:
            _listener.on_resize(static_cast<int>(LOWORD(lparam)), static_cast<int>(HIWORD(lparam)));
            return 0;
        case WM_KEYDOWN:
        case WM_SYSKEYDOWN:
            if (handle_key_down(wparam))
            {
                return 0;
            }
            break;
        case WM_TIMER:
            _listener.on_timer(static_cast<UINT_PTR>(wparam));
            return 0;
        case WM_CLOSE:
            if (!_closing)
            {
                _closing = true;
                _listener.on_closing();
            }
            ::DestroyWindow(_hwnd);
            return 0;
        case WM_DESTROY:
            _hwnd = nullptr;
            ::PostQuitMessage(0);
            return 0;
        default:
            break;
        }

        return ::DefWindowProcW(_hwnd, msg, wparam, lparam);
    }
}
