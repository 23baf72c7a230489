#include "embedding/window_classifier.hpp"

#include <algorithm>

namespace wh::embedding
{
    std::expected<void, Rejection> WindowClassifier::classify(
        const std::wstring_view class_name,
        const DWORD owner_process_id,
        const DWORD self_process_id)
    {
        if (owner_process_id == self_process_id)
        {
            return std::unexpected(Rejection{ .reason = RejectReason::self_process });
        }

        if (is_forbidden_class(class_name))
        {
            return std::unexpected(Rejection{
                .reason = RejectReason::forbidden_class,
                .class_name = std::wstring(class_name),
            });
        }

        return {};
    }

    std::expected<void, Rejection> WindowClassifier::classify_window(
        const native::NativeWindows& windows,
        const core::WindowHandle window)
    {
        return classify(windows.get_class(window), windows.get_process_id(window), windows.self_process_id());
    }

    bool WindowClassifier::is_forbidden_class(const std::wstring_view class_name) noexcept
    {
        return std::ranges::any_of(forbidden_classes, [class_name](const std::wstring_view forbidden) {
            return class_name.find(forbidden) != std::wstring_view::npos;
        });
    }

    bool WindowClassifier::is_presentation_excluded(const std::wstring_view class_name) noexcept
    {
        return std::ranges::find(presentation_excluded_classes, class_name) != presentation_excluded_classes.end();
    }
}
