#pragma once

// Style bit bundles used when a foreign top-level window becomes a child pane
// of the host frame and when it is handed back.
//
// The engine only ever combines these named bundles; individual `WS_*` bits
// do not appear elsewhere in the embedding code.

#include "native/geometry.hpp"

#include <Windows.h>

namespace wh::native
{
    using StyleBits = DWORD;

    namespace styles
    {
        // Decorations and popup semantics stripped from an embedded window:
        // caption, resizable frame, min/max/system menu buttons, popup flag,
        // thin and dialog borders.
        inline constexpr StyleBits stripped_decorations =
            WS_CAPTION |
            WS_THICKFRAME |
            WS_MINIMIZEBOX |
            WS_MAXIMIZEBOX |
            WS_SYSMENU |
            WS_POPUP |
            WS_BORDER |
            WS_DLGFRAME;

        inline constexpr StyleBits embedded_child_bits = WS_CHILD | WS_VISIBLE;

        inline constexpr StyleBits host_clip_children = WS_CLIPCHILDREN;

        inline constexpr StyleBits child_marker = WS_CHILD;

        // Applied on release when no original state was recorded.
        inline constexpr StyleBits fallback_top_level = WS_OVERLAPPEDWINDOW | WS_VISIBLE;

        inline constexpr Rect fallback_screen_rect = Rect::from_origin_size(100, 100, 800, 600);

        [[nodiscard]] constexpr StyleBits to_embedded(const StyleBits original) noexcept
        {
            return (original & ~stripped_decorations) | embedded_child_bits;
        }
    }

    // `set_pos` flag combinations. Each names one use site's contract.
    namespace placement
    {
        // Raise to the top of the parent's Z-order, keep geometry.
        inline constexpr UINT raise_in_place = SWP_NOMOVE | SWP_NOSIZE | SWP_SHOWWINDOW;

        // Move/resize inside the host frame without touching Z-order or focus.
        inline constexpr UINT move_resize_quiet = SWP_NOZORDER | SWP_NOACTIVATE | SWP_SHOWWINDOW;

        // Re-apply restored styles together with the saved rectangle.
        inline constexpr UINT restore_frame = SWP_FRAMECHANGED | SWP_SHOWWINDOW;
    }

    enum class InsertAfter
    {
        top,
        unchanged,
    };
}
