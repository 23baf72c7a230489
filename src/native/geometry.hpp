#pragma once

#include <Windows.h>

namespace wh::native
{
    struct Point final
    {
        int x{ 0 };
        int y{ 0 };

        [[nodiscard]] friend constexpr bool operator==(const Point&, const Point&) noexcept = default;
    };

    // Edge-based rectangle (Win32 `RECT` semantics: `right`/`bottom` are
    // exclusive). Whether it is in screen or client space is decided by the
    // producer; see the `NativeWindows` operation that returned it.
    struct Rect final
    {
        int left{ 0 };
        int top{ 0 };
        int right{ 0 };
        int bottom{ 0 };

        [[nodiscard]] static constexpr Rect from_origin_size(const int x, const int y, const int width, const int height) noexcept
        {
            return Rect{ .left = x, .top = y, .right = x + width, .bottom = y + height };
        }

        [[nodiscard]] static constexpr Rect from_win32(const RECT& rect) noexcept
        {
            return Rect{ .left = rect.left, .top = rect.top, .right = rect.right, .bottom = rect.bottom };
        }

        [[nodiscard]] constexpr int width() const noexcept
        {
            return right - left;
        }

        [[nodiscard]] constexpr int height() const noexcept
        {
            return bottom - top;
        }

        [[nodiscard]] constexpr Point origin() const noexcept
        {
            return Point{ .x = left, .y = top };
        }

        // Inclusive on every edge; used for pointer hit tests.
        [[nodiscard]] constexpr bool contains_inclusive(const Point point) const noexcept
        {
            return point.x >= left && point.x <= right && point.y >= top && point.y <= bottom;
        }

        [[nodiscard]] friend constexpr bool operator==(const Rect&, const Rect&) noexcept = default;
    };
}
