#include "native/win32_native_windows.hpp"

#include <array>
#include <new>

namespace wh::native
{
    namespace
    {
        // Window class names are limited to 256 characters by `RegisterClassEx`.
        constexpr int k_class_name_capacity = 257;

        [[nodiscard]] NativeError make_error(const std::wstring_view operation, const DWORD win32_error) noexcept
        {
            try
            {
                return NativeError{
                    .operation = std::wstring(operation),
                    .win32_error = win32_error == ERROR_SUCCESS ? ERROR_GEN_FAILURE : win32_error,
                };
            }
            catch (const std::bad_alloc&)
            {
                return NativeError{ .operation = {}, .win32_error = ERROR_OUTOFMEMORY };
            }
        }

        [[nodiscard]] NativeError last_error(const std::wstring_view operation) noexcept
        {
            return make_error(operation, ::GetLastError());
        }

        // `Get/SetWindowLongPtrW` return 0 both for failure and for a genuine
        // zero value; only a non-zero last error distinguishes them.
        [[nodiscard]] NativeResult<StyleBits> read_long(const HWND window, const int index, const std::wstring_view operation) noexcept
        {
            ::SetLastError(ERROR_SUCCESS);
            const LONG_PTR value = ::GetWindowLongPtrW(window, index);
            if (value == 0)
            {
                const DWORD error = ::GetLastError();
                if (error != ERROR_SUCCESS)
                {
                    return std::unexpected(make_error(operation, error));
                }
            }
            return static_cast<StyleBits>(value);
        }

        [[nodiscard]] NativeResult<void> write_long(const HWND window, const int index, const StyleBits value, const std::wstring_view operation) noexcept
        {
            ::SetLastError(ERROR_SUCCESS);
            const LONG_PTR previous = ::SetWindowLongPtrW(window, index, static_cast<LONG_PTR>(value));
            if (previous == 0)
            {
                const DWORD error = ::GetLastError();
                if (error != ERROR_SUCCESS)
                {
                    return std::unexpected(make_error(operation, error));
                }
            }
            return {};
        }

        struct TopLevelCollector final
        {
            std::vector<core::WindowHandle> windows;
            bool out_of_memory{ false };
        };

        BOOL CALLBACK collect_top_level(const HWND window, const LPARAM param) noexcept
        {
            auto* collector = reinterpret_cast<TopLevelCollector*>(param);
            if (::IsWindowVisible(window) == FALSE)
            {
                return TRUE;
            }

            try
            {
                collector->windows.emplace_back(window);
            }
            catch (const std::bad_alloc&)
            {
                collector->out_of_memory = true;
                return FALSE;
            }
            return TRUE;
        }

        struct DescendantSearch final
        {
            ClassPredicate predicate{};
            HWND match{};
        };

        BOOL CALLBACK match_descendant(const HWND window, const LPARAM param) noexcept
        {
            auto* search = reinterpret_cast<DescendantSearch*>(param);

            std::array<wchar_t, k_class_name_capacity> buffer{};
            const int length = ::GetClassNameW(window, buffer.data(), static_cast<int>(buffer.size()));
            if (length <= 0)
            {
                return TRUE;
            }

            if (search->predicate(std::wstring_view(buffer.data(), static_cast<size_t>(length))))
            {
                search->match = window;
                return FALSE;
            }
            return TRUE;
        }
    }

    NativeResult<std::vector<core::WindowHandle>> Win32NativeWindows::enumerate_top_level() const
    {
        TopLevelCollector collector{};
        // EnumWindows walks the Z-order from the top. A callback returning
        // FALSE also makes it return FALSE, so only the collector flag tells
        // an early stop apart from a real failure.
        if (::EnumWindows(&collect_top_level, reinterpret_cast<LPARAM>(&collector)) == FALSE && !collector.out_of_memory)
        {
            const DWORD error = ::GetLastError();
            if (error != ERROR_SUCCESS)
            {
                return std::unexpected(make_error(L"EnumWindows", error));
            }
        }
        if (collector.out_of_memory)
        {
            return std::unexpected(make_error(L"EnumWindows", ERROR_OUTOFMEMORY));
        }
        return std::move(collector.windows);
    }

    bool Win32NativeWindows::is_valid(const core::WindowHandle window) const noexcept
    {
        return !window.empty() && ::IsWindow(window.get()) != FALSE;
    }

    bool Win32NativeWindows::is_visible(const core::WindowHandle window) const noexcept
    {
        return ::IsWindowVisible(window.get()) != FALSE;
    }

    NativeResult<StyleBits> Win32NativeWindows::get_style(const core::WindowHandle window) const noexcept
    {
        return read_long(window.get(), GWL_STYLE, L"GetWindowLongPtrW(GWL_STYLE)");
    }

    NativeResult<void> Win32NativeWindows::set_style(const core::WindowHandle window, const StyleBits style) noexcept
    {
        return write_long(window.get(), GWL_STYLE, style, L"SetWindowLongPtrW(GWL_STYLE)");
    }

    NativeResult<StyleBits> Win32NativeWindows::get_exstyle(const core::WindowHandle window) const noexcept
    {
        return read_long(window.get(), GWL_EXSTYLE, L"GetWindowLongPtrW(GWL_EXSTYLE)");
    }

    NativeResult<void> Win32NativeWindows::set_exstyle(const core::WindowHandle window, const StyleBits exstyle) noexcept
    {
        return write_long(window.get(), GWL_EXSTYLE, exstyle, L"SetWindowLongPtrW(GWL_EXSTYLE)");
    }

    NativeResult<Rect> Win32NativeWindows::get_window_rect(const core::WindowHandle window) const noexcept
    {
        RECT rect{};
        if (::GetWindowRect(window.get(), &rect) == FALSE)
        {
            return std::unexpected(last_error(L"GetWindowRect"));
        }
        return Rect::from_win32(rect);
    }

    NativeResult<Rect> Win32NativeWindows::get_client_rect(const core::WindowHandle window) const noexcept
    {
        RECT rect{};
        if (::GetClientRect(window.get(), &rect) == FALSE)
        {
            return std::unexpected(last_error(L"GetClientRect"));
        }
        return Rect::from_win32(rect);
    }

    NativeResult<Point> Win32NativeWindows::screen_to_client(const core::WindowHandle window, const Point point) const noexcept
    {
        POINT converted{ .x = point.x, .y = point.y };
        if (::ScreenToClient(window.get(), &converted) == FALSE)
        {
            return std::unexpected(last_error(L"ScreenToClient"));
        }
        return Point{ .x = converted.x, .y = converted.y };
    }

    NativeResult<Point> Win32NativeWindows::client_to_screen(const core::WindowHandle window, const Point point) const noexcept
    {
        POINT converted{ .x = point.x, .y = point.y };
        if (::ClientToScreen(window.get(), &converted) == FALSE)
        {
            return std::unexpected(last_error(L"ClientToScreen"));
        }
        return Point{ .x = converted.x, .y = converted.y };
    }

    core::WindowHandle Win32NativeWindows::get_parent(const core::WindowHandle window) const noexcept
    {
        // GA_PARENT reports the desktop window for top-level windows;
        // GetAncestor avoids GetParent's owner-window ambiguity.
        const HWND parent = ::GetAncestor(window.get(), GA_PARENT);
        if (parent == nullptr || parent == ::GetDesktopWindow())
        {
            return {};
        }
        return core::WindowHandle(parent);
    }

    NativeResult<void> Win32NativeWindows::set_parent(const core::WindowHandle window, const core::WindowHandle parent) noexcept
    {
        // A top-level window has no previous parent, so a null return is
        // only a failure when the last error says so.
        ::SetLastError(ERROR_SUCCESS);
        if (::SetParent(window.get(), parent.get()) == nullptr)
        {
            const DWORD error = ::GetLastError();
            if (error != ERROR_SUCCESS)
            {
                return std::unexpected(make_error(L"SetParent", error));
            }
        }
        return {};
    }

    NativeResult<void> Win32NativeWindows::set_pos(
        const core::WindowHandle window,
        const InsertAfter after,
        const Rect rect,
        UINT flags) noexcept
    {
        HWND insert_after = HWND_TOP;
        if (after == InsertAfter::unchanged)
        {
            insert_after = nullptr;
            flags |= SWP_NOZORDER;
        }

        if (::SetWindowPos(window.get(), insert_after, rect.left, rect.top, rect.width(), rect.height(), flags) == FALSE)
        {
            return std::unexpected(last_error(L"SetWindowPos"));
        }
        return {};
    }

    void Win32NativeWindows::show(const core::WindowHandle window) noexcept
    {
        (void)::ShowWindow(window.get(), SW_SHOW);
    }

    void Win32NativeWindows::hide(const core::WindowHandle window) noexcept
    {
        (void)::ShowWindow(window.get(), SW_HIDE);
    }

    void Win32NativeWindows::restore(const core::WindowHandle window) noexcept
    {
        (void)::ShowWindow(window.get(), SW_RESTORE);
    }

    bool Win32NativeWindows::bring_to_foreground(const core::WindowHandle window) noexcept
    {
        return ::SetForegroundWindow(window.get()) != FALSE;
    }

    NativeResult<void> Win32NativeWindows::post_close(const core::WindowHandle window) noexcept
    {
        if (::PostMessageW(window.get(), WM_CLOSE, 0, 0) == FALSE)
        {
            return std::unexpected(last_error(L"PostMessageW(WM_CLOSE)"));
        }
        return {};
    }

    std::wstring Win32NativeWindows::get_title(const core::WindowHandle window) const
    {
        const int length = ::GetWindowTextLengthW(window.get());
        if (length <= 0)
        {
            return {};
        }

        std::wstring title(static_cast<size_t>(length) + 1, L'\0');
        const int copied = ::GetWindowTextW(window.get(), title.data(), length + 1);
        title.resize(copied > 0 ? static_cast<size_t>(copied) : 0);
        return title;
    }

    std::wstring Win32NativeWindows::get_class(const core::WindowHandle window) const
    {
        std::array<wchar_t, k_class_name_capacity> buffer{};
        const int length = ::GetClassNameW(window.get(), buffer.data(), static_cast<int>(buffer.size()));
        if (length <= 0)
        {
            return {};
        }
        return std::wstring(buffer.data(), static_cast<size_t>(length));
    }

    DWORD Win32NativeWindows::get_process_id(const core::WindowHandle window) const noexcept
    {
        DWORD process_id = 0;
        (void)::GetWindowThreadProcessId(window.get(), &process_id);
        return process_id;
    }

    DWORD Win32NativeWindows::get_thread_id(const core::WindowHandle window) const noexcept
    {
        return ::GetWindowThreadProcessId(window.get(), nullptr);
    }

    DWORD Win32NativeWindows::self_process_id() const noexcept
    {
        return ::GetCurrentProcessId();
    }

    DWORD Win32NativeWindows::current_thread_id() const noexcept
    {
        return ::GetCurrentThreadId();
    }

    NativeResult<void> Win32NativeWindows::attach_input(const DWORD source_thread, const DWORD target_thread, const bool attach) noexcept
    {
        if (::AttachThreadInput(source_thread, target_thread, attach ? TRUE : FALSE) == FALSE)
        {
            return std::unexpected(last_error(attach ? L"AttachThreadInput(attach)" : L"AttachThreadInput(detach)"));
        }
        return {};
    }

    NativeResult<void> Win32NativeWindows::set_focus(const core::WindowHandle window) noexcept
    {
        ::SetLastError(ERROR_SUCCESS);
        if (::SetFocus(window.get()) == nullptr)
        {
            const DWORD error = ::GetLastError();
            if (error != ERROR_SUCCESS)
            {
                return std::unexpected(make_error(L"SetFocus", error));
            }
        }
        return {};
    }

    NativeResult<void> Win32NativeWindows::set_active(const core::WindowHandle window) noexcept
    {
        ::SetLastError(ERROR_SUCCESS);
        if (::SetActiveWindow(window.get()) == nullptr)
        {
            const DWORD error = ::GetLastError();
            if (error != ERROR_SUCCESS)
            {
                return std::unexpected(make_error(L"SetActiveWindow", error));
            }
        }
        return {};
    }

    NativeResult<Point> Win32NativeWindows::cursor_pos() const noexcept
    {
        POINT point{};
        if (::GetCursorPos(&point) == FALSE)
        {
            return std::unexpected(last_error(L"GetCursorPos"));
        }
        return Point{ .x = point.x, .y = point.y };
    }

    bool Win32NativeWindows::is_left_mouse_down() const noexcept
    {
        return (static_cast<unsigned short>(::GetAsyncKeyState(VK_LBUTTON)) & 0x8000u) != 0;
    }

    core::WindowHandle Win32NativeWindows::foreground_window() const noexcept
    {
        return core::WindowHandle(::GetForegroundWindow());
    }

    core::WindowHandle Win32NativeWindows::find_descendant(const core::WindowHandle window, const ClassPredicate predicate) const
    {
        if (predicate == nullptr)
        {
            return {};
        }

        // EnumChildWindows already recurses into grandchildren, parent
        // before its own children.
        DescendantSearch search{ .predicate = predicate };
        (void)::EnumChildWindows(window.get(), &match_descendant, reinterpret_cast<LPARAM>(&search));
        return core::WindowHandle(search.match);
    }
}
