#include "embedding/window_enumerator.hpp"

#include "embedding/window_classifier.hpp"

#include <optional>

namespace wh::embedding
{
    namespace
    {
        [[nodiscard]] std::optional<WindowDescriptor> describe_if_presentable(
            const native::NativeWindows& windows,
            const core::WindowHandle window,
            const EnumerationPolicy& policy)
        {
            if (!windows.is_visible(window))
            {
                return std::nullopt;
            }
            if (windows.get_process_id(window) == windows.self_process_id())
            {
                return std::nullopt;
            }

            std::wstring title = windows.get_title(window);
            if (title.empty())
            {
                return std::nullopt;
            }
            if (!policy.product_name.empty() && title.find(policy.product_name) != std::wstring::npos)
            {
                return std::nullopt;
            }

            std::wstring class_name = windows.get_class(window);
            if (WindowClassifier::is_presentation_excluded(class_name))
            {
                return std::nullopt;
            }

            const auto rect = windows.get_window_rect(window);
            if (!rect)
            {
                return std::nullopt;
            }
            if (rect->width() <= policy.min_width || rect->height() <= policy.min_height)
            {
                return std::nullopt;
            }

            return WindowDescriptor{
                .window = window,
                .title = std::move(title),
                .class_name = std::move(class_name),
                .width = rect->width(),
                .height = rect->height(),
            };
        }
    }

    native::NativeResult<std::vector<WindowDescriptor>> WindowEnumerator::list_candidates(
        const native::NativeWindows& windows,
        const EnumerationPolicy& policy)
    {
        auto snapshot = windows.enumerate_top_level();
        if (!snapshot)
        {
            return std::unexpected(std::move(snapshot.error()));
        }

        std::vector<WindowDescriptor> candidates;
        for (const core::WindowHandle window : *snapshot)
        {
            if (auto descriptor = describe_if_presentable(windows, window, policy))
            {
                candidates.push_back(std::move(*descriptor));
            }
        }
        return candidates;
    }
}
