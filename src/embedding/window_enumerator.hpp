#pragma once

// Window picker snapshot: the foreign top-level windows worth offering to
// the user. Advisory only; `embed` still applies `WindowClassifier`.

#include "core/window_handle.hpp"
#include "native/native_windows.hpp"

#include <string>
#include <vector>

namespace wh::embedding
{
    struct WindowDescriptor final
    {
        core::WindowHandle window{};
        std::wstring title;
        std::wstring class_name;
        int width{ 0 };
        int height{ 0 };
    };

    struct EnumerationPolicy final
    {
        // Windows whose title contains this text belong to the hub itself.
        std::wstring product_name{ L"WindowHub" };

        // Strict lower bounds, in pixels.
        int min_width{ 100 };
        int min_height{ 100 };
    };

    class WindowEnumerator final
    {
    public:
        // Z-order, top first. Windows that vanish mid-snapshot are skipped.
        [[nodiscard]] static native::NativeResult<std::vector<WindowDescriptor>> list_candidates(
            const native::NativeWindows& windows,
            const EnumerationPolicy& policy);
    };
}
