#pragma once

#include "native/native_windows.hpp"

namespace wh::native
{
    // `NativeWindows` over user32. Stateless; a single instance is shared by
    // the engine and the deferred focus-detach threads.
    class Win32NativeWindows final : public NativeWindows
    {
    public:
        [[nodiscard]] NativeResult<std::vector<core::WindowHandle>> enumerate_top_level() const override;

        [[nodiscard]] bool is_valid(core::WindowHandle window) const noexcept override;
        [[nodiscard]] bool is_visible(core::WindowHandle window) const noexcept override;

        [[nodiscard]] NativeResult<StyleBits> get_style(core::WindowHandle window) const noexcept override;
        [[nodiscard]] NativeResult<void> set_style(core::WindowHandle window, StyleBits style) noexcept override;
        [[nodiscard]] NativeResult<StyleBits> get_exstyle(core::WindowHandle window) const noexcept override;
        [[nodiscard]] NativeResult<void> set_exstyle(core::WindowHandle window, StyleBits exstyle) noexcept override;

        [[nodiscard]] NativeResult<Rect> get_window_rect(core::WindowHandle window) const noexcept override;
        [[nodiscard]] NativeResult<Rect> get_client_rect(core::WindowHandle window) const noexcept override;
        [[nodiscard]] NativeResult<Point> screen_to_client(core::WindowHandle window, Point point) const noexcept override;
        [[nodiscard]] NativeResult<Point> client_to_screen(core::WindowHandle window, Point point) const noexcept override;

        [[nodiscard]] core::WindowHandle get_parent(core::WindowHandle window) const noexcept override;
        [[nodiscard]] NativeResult<void> set_parent(core::WindowHandle window, core::WindowHandle parent) noexcept override;
        [[nodiscard]] NativeResult<void> set_pos(core::WindowHandle window, InsertAfter after, Rect rect, UINT flags) noexcept override;

        void show(core::WindowHandle window) noexcept override;
        void hide(core::WindowHandle window) noexcept override;
        void restore(core::WindowHandle window) noexcept override;
        bool bring_to_foreground(core::WindowHandle window) noexcept override;

        [[nodiscard]] NativeResult<void> post_close(core::WindowHandle window) noexcept override;

        [[nodiscard]] std::wstring get_title(core::WindowHandle window) const override;
        [[nodiscard]] std::wstring get_class(core::WindowHandle window) const override;

        [[nodiscard]] DWORD get_process_id(core::WindowHandle window) const noexcept override;
        [[nodiscard]] DWORD get_thread_id(core::WindowHandle window) const noexcept override;
        [[nodiscard]] DWORD self_process_id() const noexcept override;
        [[nodiscard]] DWORD current_thread_id() const noexcept override;

        [[nodiscard]] NativeResult<void> attach_input(DWORD source_thread, DWORD target_thread, bool attach) noexcept override;
        [[nodiscard]] NativeResult<void> set_focus(core::WindowHandle window) noexcept override;
        [[nodiscard]] NativeResult<void> set_active(core::WindowHandle window) noexcept override;

        [[nodiscard]] NativeResult<Point> cursor_pos() const noexcept override;
        [[nodiscard]] bool is_left_mouse_down() const noexcept override;
        [[nodiscard]] core::WindowHandle foreground_window() const noexcept override;

        [[nodiscard]] core::WindowHandle find_descendant(core::WindowHandle window, ClassPredicate predicate) const override;
    };
}
