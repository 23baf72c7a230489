#pragma once

// In-memory desktop behind the `NativeWindows` interface.
//
// Rectangles are stored relative to the parent's client area (screen
// coordinates for top-level windows), like the real window manager. Every
// primitive call is recorded so tests can assert on what the engine asked
// for, and individual primitives can be told to fail or to destroy the
// window they are called on.

#include "embedding/input_detach_scheduler.hpp"
#include "native/native_windows.hpp"

#include <Windows.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wh::tests
{
    inline constexpr DWORD k_host_process_id = 1000;
    inline constexpr DWORD k_host_thread_id = 100;

    struct FakeWindowSpec final
    {
        std::wstring title;
        std::wstring class_name{ L"FakeWindowClass" };
        DWORD process_id{ 2000 };
        DWORD thread_id{ 200 };
        native::StyleBits style{ WS_OVERLAPPEDWINDOW | WS_VISIBLE };
        native::StyleBits exstyle{ 0 };
        native::Rect rect{ native::Rect::from_origin_size(0, 0, 640, 480) };
        core::WindowHandle parent{};
        // Offset of the client area inside the window rectangle.
        native::Point client_offset{};
    };

    struct SetPosCall final
    {
        core::WindowHandle window{};
        native::InsertAfter after{ native::InsertAfter::top };
        native::Rect rect{};
        UINT flags{ 0 };

        [[nodiscard]] bool moves_or_resizes() const noexcept
        {
            return (flags & (SWP_NOMOVE | SWP_NOSIZE)) != (SWP_NOMOVE | SWP_NOSIZE);
        }
    };

    struct AttachCall final
    {
        DWORD source_thread{};
        DWORD target_thread{};
        bool attach{ false };
    };

    class FakeNativeWindows final : public native::NativeWindows
    {
    public:
        struct Window final
        {
            core::WindowHandle handle{};
            FakeWindowSpec spec;
            bool alive{ true };
            bool minimized{ false };
            bool close_posted{ false };
        };

        core::WindowHandle create(FakeWindowSpec spec)
        {
            const std::scoped_lock lock(_lock);
            _next_value += 0x10;
            const core::WindowHandle handle = core::WindowHandle::from_uintptr(_next_value);
            _windows.emplace(handle.as_uintptr(), Window{ .handle = handle, .spec = std::move(spec) });
            _z_order.insert(_z_order.begin(), handle);
            return handle;
        }

        void destroy(const core::WindowHandle window)
        {
            const std::scoped_lock lock(_lock);
            if (Window* found = find(window))
            {
                found->alive = false;
            }
        }

        // The next call of `operation` (Win32 primitive name) fails.
        void fail_next(const std::wstring_view operation, const DWORD error = ERROR_ACCESS_DENIED)
        {
            const std::scoped_lock lock(_lock);
            _failures[std::wstring(operation)] = error;
        }

        // The next call of `operation` destroys its window first and fails.
        void vanish_on(const std::wstring_view operation)
        {
            const std::scoped_lock lock(_lock);
            _vanish_on[std::wstring(operation)] = true;
        }

        [[nodiscard]] Window state(const core::WindowHandle window) const
        {
            const std::scoped_lock lock(_lock);
            const Window* found = find(window);
            return found != nullptr ? *found : Window{};
        }

        [[nodiscard]] std::vector<SetPosCall> set_pos_calls() const
        {
            const std::scoped_lock lock(_lock);
            return _set_pos_calls;
        }

        [[nodiscard]] std::size_t move_resize_count(const core::WindowHandle window) const
        {
            const std::scoped_lock lock(_lock);
            return static_cast<std::size_t>(std::ranges::count_if(_set_pos_calls, [&](const SetPosCall& call) {
                return call.window == window && call.moves_or_resizes();
            }));
        }

        [[nodiscard]] std::vector<AttachCall> attach_calls() const
        {
            const std::scoped_lock lock(_lock);
            return _attach_calls;
        }

        [[nodiscard]] std::vector<core::WindowHandle> focus_calls() const
        {
            const std::scoped_lock lock(_lock);
            return _focus_calls;
        }

        void clear_calls()
        {
            const std::scoped_lock lock(_lock);
            _set_pos_calls.clear();
            _attach_calls.clear();
            _focus_calls.clear();
        }

        void set_current_thread_id(const DWORD thread_id) noexcept
        {
            _current_thread_id = thread_id;
        }

        void set_cursor(const native::Point point) noexcept
        {
            const std::scoped_lock lock(_lock);
            _cursor = point;
        }

        void set_left_mouse_down(const bool down) noexcept
        {
            _left_mouse_down = down;
        }

        [[nodiscard]] native::NativeResult<std::vector<core::WindowHandle>> enumerate_top_level() const override
        {
            const std::scoped_lock lock(_lock);
            if (auto failure = take_failure(L"EnumWindows", nullptr))
            {
                return std::unexpected(*failure);
            }

            std::vector<core::WindowHandle> result;
            for (const core::WindowHandle handle : _z_order)
            {
                const Window* window = find(handle);
                if (window != nullptr && window->alive && !window->spec.parent && visible(*window))
                {
                    result.push_back(handle);
                }
            }
            return result;
        }

        [[nodiscard]] bool is_valid(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            return live(window) != nullptr;
        }

        [[nodiscard]] bool is_visible(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr && visible(*found);
        }

        [[nodiscard]] native::NativeResult<native::StyleBits> get_style(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"GetWindowLongPtrW", window, found))
            {
                return std::unexpected(*failure);
            }
            return found->spec.style;
        }

        [[nodiscard]] native::NativeResult<void> set_style(const core::WindowHandle window, const native::StyleBits style) noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"SetWindowLongPtrW", window, found))
            {
                return std::unexpected(*failure);
            }
            found->spec.style = style;
            return {};
        }

        [[nodiscard]] native::NativeResult<native::StyleBits> get_exstyle(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"GetWindowLongPtrW", window, found))
            {
                return std::unexpected(*failure);
            }
            return found->spec.exstyle;
        }

        [[nodiscard]] native::NativeResult<void> set_exstyle(const core::WindowHandle window, const native::StyleBits exstyle) noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"SetWindowLongPtrW", window, found))
            {
                return std::unexpected(*failure);
            }
            found->spec.exstyle = exstyle;
            return {};
        }

        [[nodiscard]] native::NativeResult<native::Rect> get_window_rect(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"GetWindowRect", window, found))
            {
                return std::unexpected(*failure);
            }
            const native::Point origin = screen_origin(*found);
            return native::Rect::from_origin_size(origin.x, origin.y, found->spec.rect.width(), found->spec.rect.height());
        }

        [[nodiscard]] native::NativeResult<native::Rect> get_client_rect(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"GetClientRect", window, found))
            {
                return std::unexpected(*failure);
            }
            const FakeWindowSpec& spec = found->spec;
            return native::Rect::from_origin_size(
                0,
                0,
                spec.rect.width() - 2 * spec.client_offset.x,
                spec.rect.height() - spec.client_offset.y - spec.client_offset.x);
        }

        [[nodiscard]] native::NativeResult<native::Point> screen_to_client(const core::WindowHandle window, const native::Point point) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"ScreenToClient", window, found))
            {
                return std::unexpected(*failure);
            }
            const native::Point origin = client_origin(*found);
            return native::Point{ .x = point.x - origin.x, .y = point.y - origin.y };
        }

        [[nodiscard]] native::NativeResult<native::Point> client_to_screen(const core::WindowHandle window, const native::Point point) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"ClientToScreen", window, found))
            {
                return std::unexpected(*failure);
            }
            const native::Point origin = client_origin(*found);
            return native::Point{ .x = point.x + origin.x, .y = point.y + origin.y };
        }

        [[nodiscard]] core::WindowHandle get_parent(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr ? found->spec.parent : core::WindowHandle{};
        }

        [[nodiscard]] native::NativeResult<void> set_parent(const core::WindowHandle window, const core::WindowHandle parent) noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"SetParent", window, found))
            {
                return std::unexpected(*failure);
            }
            if (parent && live(parent) == nullptr)
            {
                return std::unexpected(native::NativeError{ .operation = L"SetParent", .win32_error = ERROR_INVALID_WINDOW_HANDLE });
            }
            found->spec.parent = parent;
            return {};
        }

        [[nodiscard]] native::NativeResult<void> set_pos(
            const core::WindowHandle window,
            const native::InsertAfter after,
            const native::Rect rect,
            const UINT flags) noexcept override
        {
            const std::scoped_lock lock(_lock);
            _set_pos_calls.push_back(SetPosCall{ .window = window, .after = after, .rect = rect, .flags = flags });

            Window* found = nullptr;
            if (auto failure = begin(L"SetWindowPos", window, found))
            {
                return std::unexpected(*failure);
            }

            native::Rect& current = found->spec.rect;
            const int width = (flags & SWP_NOSIZE) != 0 ? current.width() : rect.width();
            const int height = (flags & SWP_NOSIZE) != 0 ? current.height() : rect.height();
            const int left = (flags & SWP_NOMOVE) != 0 ? current.left : rect.left;
            const int top = (flags & SWP_NOMOVE) != 0 ? current.top : rect.top;
            current = native::Rect::from_origin_size(left, top, width, height);

            if ((flags & SWP_SHOWWINDOW) != 0)
            {
                found->spec.style |= WS_VISIBLE;
            }
            if (after == native::InsertAfter::top && (flags & SWP_NOZORDER) == 0)
            {
                std::erase(_z_order, window);
                _z_order.insert(_z_order.begin(), window);
            }
            return {};
        }

        void show(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            if (Window* found = live(window))
            {
                found->spec.style |= WS_VISIBLE;
            }
        }

        void hide(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            if (Window* found = live(window))
            {
                found->spec.style &= ~static_cast<native::StyleBits>(WS_VISIBLE);
            }
        }

        void restore(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            if (Window* found = live(window))
            {
                found->minimized = false;
                found->spec.style |= WS_VISIBLE;
            }
        }

        bool bring_to_foreground(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            if (live(window) == nullptr)
            {
                return false;
            }
            _foreground = window;
            return true;
        }

        [[nodiscard]] native::NativeResult<void> post_close(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"PostMessageW", window, found))
            {
                return std::unexpected(*failure);
            }
            found->close_posted = true;
            return {};
        }

        [[nodiscard]] std::wstring get_title(const core::WindowHandle window) const override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr ? found->spec.title : std::wstring{};
        }

        [[nodiscard]] std::wstring get_class(const core::WindowHandle window) const override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr ? found->spec.class_name : std::wstring{};
        }

        [[nodiscard]] DWORD get_process_id(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr ? found->spec.process_id : 0;
        }

        [[nodiscard]] DWORD get_thread_id(const core::WindowHandle window) const noexcept override
        {
            const std::scoped_lock lock(_lock);
            const Window* found = live(window);
            return found != nullptr ? found->spec.thread_id : 0;
        }

        [[nodiscard]] DWORD self_process_id() const noexcept override
        {
            return k_host_process_id;
        }

        [[nodiscard]] DWORD current_thread_id() const noexcept override
        {
            return _current_thread_id;
        }

        [[nodiscard]] native::NativeResult<void> attach_input(const DWORD source_thread, const DWORD target_thread, const bool attach) noexcept override
        {
            const std::scoped_lock lock(_lock);
            _attach_calls.push_back(AttachCall{ .source_thread = source_thread, .target_thread = target_thread, .attach = attach });
            if (auto failure = take_failure(L"AttachThreadInput", nullptr))
            {
                return std::unexpected(*failure);
            }
            return {};
        }

        [[nodiscard]] native::NativeResult<void> set_focus(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            _focus_calls.push_back(window);
            Window* found = nullptr;
            if (auto failure = begin(L"SetFocus", window, found))
            {
                return std::unexpected(*failure);
            }
            return {};
        }

        [[nodiscard]] native::NativeResult<void> set_active(const core::WindowHandle window) noexcept override
        {
            const std::scoped_lock lock(_lock);
            Window* found = nullptr;
            if (auto failure = begin(L"SetActiveWindow", window, found))
            {
                return std::unexpected(*failure);
            }
            return {};
        }

        [[nodiscard]] native::NativeResult<native::Point> cursor_pos() const noexcept override
        {
            const std::scoped_lock lock(_lock);
            return _cursor;
        }

        [[nodiscard]] bool is_left_mouse_down() const noexcept override
        {
            return _left_mouse_down;
        }

        [[nodiscard]] core::WindowHandle foreground_window() const noexcept override
        {
            const std::scoped_lock lock(_lock);
            return _foreground;
        }

        [[nodiscard]] core::WindowHandle find_descendant(const core::WindowHandle window, const native::ClassPredicate predicate) const override
        {
            const std::scoped_lock lock(_lock);
            return find_descendant_locked(window, predicate);
        }

    private:
        [[nodiscard]] Window* find(const core::WindowHandle window) const
        {
            const auto it = _windows.find(window.as_uintptr());
            return it != _windows.end() ? const_cast<Window*>(&it->second) : nullptr;
        }

        [[nodiscard]] Window* live(const core::WindowHandle window) const noexcept
        {
            Window* found = find(window);
            return found != nullptr && found->alive ? found : nullptr;
        }

        [[nodiscard]] static bool visible(const Window& window) noexcept
        {
            return (window.spec.style & WS_VISIBLE) != 0;
        }

        [[nodiscard]] std::optional<native::NativeError> take_failure(const std::wstring_view operation, Window* window) const
        {
            const std::wstring key(operation);
            if (const auto vanish = _vanish_on.find(key); vanish != _vanish_on.end())
            {
                _vanish_on.erase(vanish);
                if (window != nullptr)
                {
                    window->alive = false;
                }
                return native::NativeError{ .operation = key, .win32_error = ERROR_INVALID_WINDOW_HANDLE };
            }
            if (const auto failure = _failures.find(key); failure != _failures.end())
            {
                native::NativeError error{ .operation = key, .win32_error = failure->second };
                _failures.erase(failure);
                return error;
            }
            return std::nullopt;
        }

        // Resolves a live window and applies any injected failure.
        [[nodiscard]] std::optional<native::NativeError> begin(const std::wstring_view operation, const core::WindowHandle window, Window*& found) const
        {
            found = live(window);
            if (found == nullptr)
            {
                return native::NativeError{ .operation = std::wstring(operation), .win32_error = ERROR_INVALID_WINDOW_HANDLE };
            }
            return take_failure(operation, found);
        }

        [[nodiscard]] native::Point screen_origin(const Window& window) const
        {
            native::Point origin = window.spec.rect.origin();
            if (window.spec.parent)
            {
                if (const Window* parent = find(window.spec.parent))
                {
                    const native::Point parent_client = client_origin(*parent);
                    origin.x += parent_client.x;
                    origin.y += parent_client.y;
                }
            }
            return origin;
        }

        [[nodiscard]] native::Point client_origin(const Window& window) const
        {
            const native::Point origin = screen_origin(window);
            return native::Point{ .x = origin.x + window.spec.client_offset.x, .y = origin.y + window.spec.client_offset.y };
        }

        [[nodiscard]] core::WindowHandle find_descendant_locked(const core::WindowHandle window, const native::ClassPredicate predicate) const
        {
            for (const auto& [value, child] : _windows)
            {
                if (!child.alive || child.spec.parent != window)
                {
                    continue;
                }
                if (predicate(child.spec.class_name))
                {
                    return child.handle;
                }
                if (const core::WindowHandle nested = find_descendant_locked(child.handle, predicate))
                {
                    return nested;
                }
            }
            return {};
        }

        mutable std::recursive_mutex _lock;
        std::map<std::uintptr_t, Window> _windows;
        std::vector<core::WindowHandle> _z_order;
        mutable std::map<std::wstring, DWORD> _failures;
        mutable std::map<std::wstring, bool> _vanish_on;
        std::vector<SetPosCall> _set_pos_calls;
        std::vector<AttachCall> _attach_calls;
        std::vector<core::WindowHandle> _focus_calls;
        std::uintptr_t _next_value{ 0x1000 };
        std::atomic<DWORD> _current_thread_id{ k_host_thread_id };
        std::atomic<bool> _left_mouse_down{ false };
        native::Point _cursor{};
        core::WindowHandle _foreground{};
    };

    struct ScheduledDetach final
    {
        DWORD source_thread{};
        DWORD target_thread{};
        DWORD delay_ms{};
    };

    class RecordingDetachScheduler final : public embedding::InputDetachScheduler
    {
    public:
        void schedule_detach(const DWORD source_thread, const DWORD target_thread, const DWORD delay_ms) noexcept override
        {
            const std::scoped_lock lock(_lock);
            _scheduled.push_back(ScheduledDetach{ .source_thread = source_thread, .target_thread = target_thread, .delay_ms = delay_ms });
        }

        [[nodiscard]] std::vector<ScheduledDetach> scheduled() const
        {
            const std::scoped_lock lock(_lock);
            return _scheduled;
        }

    private:
        mutable std::mutex _lock;
        std::vector<ScheduledDetach> _scheduled;
    };
}
