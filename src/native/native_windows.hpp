#pragma once

// Native Window Facade: the window-manager primitives the embedding core is
// allowed to use.
//
// Every operation is a single synchronous call into the window manager. None
// of them broadcast or wait for another thread's message queue beyond the
// one-shot send the primitive itself performs; `post_close` is asynchronous.
// Operations that the OS can report as failed return `NativeError` naming
// the primitive, so callers above this layer never see raw Win32 calls.
//
// `Win32NativeWindows` is the production implementation; tests provide an
// in-memory model of a desktop behind the same interface.

#include "core/window_handle.hpp"
#include "native/geometry.hpp"
#include "native/window_styles.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace wh::native
{
    struct NativeError final
    {
        std::wstring operation;
        DWORD win32_error{ ERROR_GEN_FAILURE };
    };

    template<typename T>
    using NativeResult = std::expected<T, NativeError>;

    // Used by `find_descendant`; receives a descendant's class name.
    using ClassPredicate = bool (*)(std::wstring_view class_name) noexcept;

    class NativeWindows
    {
    public:
        virtual ~NativeWindows() = default;

        // Visible top-level windows, top of the Z-order first.
        [[nodiscard]] virtual NativeResult<std::vector<core::WindowHandle>> enumerate_top_level() const = 0;

        [[nodiscard]] virtual bool is_valid(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual bool is_visible(core::WindowHandle window) const noexcept = 0;

        [[nodiscard]] virtual NativeResult<StyleBits> get_style(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual NativeResult<void> set_style(core::WindowHandle window, StyleBits style) noexcept = 0;
        [[nodiscard]] virtual NativeResult<StyleBits> get_exstyle(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual NativeResult<void> set_exstyle(core::WindowHandle window, StyleBits exstyle) noexcept = 0;

        [[nodiscard]] virtual NativeResult<Rect> get_window_rect(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual NativeResult<Rect> get_client_rect(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual NativeResult<Point> screen_to_client(core::WindowHandle window, Point point) const noexcept = 0;
        [[nodiscard]] virtual NativeResult<Point> client_to_screen(core::WindowHandle window, Point point) const noexcept = 0;

        // Empty handle for top-level windows.
        [[nodiscard]] virtual core::WindowHandle get_parent(core::WindowHandle window) const noexcept = 0;

        // An empty `parent` makes the window top-level again.
        [[nodiscard]] virtual NativeResult<void> set_parent(core::WindowHandle window, core::WindowHandle parent) noexcept = 0;

        // `flags` is a combination of `SWP_*` values (see `native::placement`).
        [[nodiscard]] virtual NativeResult<void> set_pos(core::WindowHandle window, InsertAfter after, Rect rect, UINT flags) noexcept = 0;

        virtual void show(core::WindowHandle window) noexcept = 0;
        virtual void hide(core::WindowHandle window) noexcept = 0;
        virtual void restore(core::WindowHandle window) noexcept = 0;
        virtual bool bring_to_foreground(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual NativeResult<void> post_close(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual std::wstring get_title(core::WindowHandle window) const = 0;
        [[nodiscard]] virtual std::wstring get_class(core::WindowHandle window) const = 0;

        // Zero when the window no longer exists.
        [[nodiscard]] virtual DWORD get_process_id(core::WindowHandle window) const noexcept = 0;
        [[nodiscard]] virtual DWORD get_thread_id(core::WindowHandle window) const noexcept = 0;

        [[nodiscard]] virtual DWORD self_process_id() const noexcept = 0;
        [[nodiscard]] virtual DWORD current_thread_id() const noexcept = 0;

        // Never call with `source_thread == target_thread`.
        [[nodiscard]] virtual NativeResult<void> attach_input(DWORD source_thread, DWORD target_thread, bool attach) noexcept = 0;

        [[nodiscard]] virtual NativeResult<void> set_focus(core::WindowHandle window) noexcept = 0;
        [[nodiscard]] virtual NativeResult<void> set_active(core::WindowHandle window) noexcept = 0;

        [[nodiscard]] virtual NativeResult<Point> cursor_pos() const noexcept = 0;
        [[nodiscard]] virtual bool is_left_mouse_down() const noexcept = 0;
        [[nodiscard]] virtual core::WindowHandle foreground_window() const noexcept = 0;

        // Depth-first over all descendants; first match or an empty handle.
        [[nodiscard]] virtual core::WindowHandle find_descendant(core::WindowHandle window, ClassPredicate predicate) const = 0;
    };
}
