#pragma once

// Eligibility rules for foreign windows.
//
// Two lists live here:
// - `forbidden_classes` gates `embed`/`can_embed`. Matching is by substring
//   so suffixed variants of shell and framework classes are covered.
// - `presentation_excluded_classes` only trims the window picker; matching
//   is exact. Embedding is still gated by the stricter classifier.
//
// The classifier is pure. `classify_window` is the convenience that reads
// the two facts it needs through the facade.

#include "core/window_handle.hpp"
#include "embedding/embed_error.hpp"
#include "native/native_windows.hpp"

#include <Windows.h>

#include <array>
#include <expected>
#include <string>
#include <string_view>

namespace wh::embedding
{
    struct Rejection final
    {
        RejectReason reason{ RejectReason::self_process };
        std::wstring class_name;
    };

    class WindowClassifier final
    {
    public:
        // Shell roots, desktop workers, taskbars, Task Manager and
        // framework-managed core windows misbehave once reparented.
        static constexpr std::array<std::wstring_view, 8> forbidden_classes{
            L"CabinetWClass",
            L"ExplorerWClass",
            L"Progman",
            L"WorkerW",
            L"Shell_TrayWnd",
            L"Shell_SecondaryTrayWnd",
            L"TaskManagerWindow",
            L"Windows.UI.Core.CoreWindow",
        };

        static constexpr std::array<std::wstring_view, 7> presentation_excluded_classes{
            L"Progman",
            L"Shell_TrayWnd",
            L"Shell_SecondaryTrayWnd",
            L"Windows.UI.Core.CoreWindow",
            L"ApplicationFrameWindow",
            L"WorkerW",
            L"TaskManagerWindow",
        };

        [[nodiscard]] static std::expected<void, Rejection> classify(
            std::wstring_view class_name,
            DWORD owner_process_id,
            DWORD self_process_id);

        [[nodiscard]] static std::expected<void, Rejection> classify_window(
            const native::NativeWindows& windows,
            core::WindowHandle window);

        [[nodiscard]] static bool is_forbidden_class(std::wstring_view class_name) noexcept;
        [[nodiscard]] static bool is_presentation_excluded(std::wstring_view class_name) noexcept;
    };
}
