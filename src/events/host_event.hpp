#pragma once

// Notifications the host raises toward the UI collaborator.
//
// Wire names are part of the UI contract and never change. `switch-tab`
// carries a one-based tab index; the other events carry no payload.

#include <Windows.h>

#include <optional>
#include <string>
#include <string_view>

namespace wh::events
{
    enum class HostEvent
    {
        switch_tab,
        close_current_tab,
        next_tab,
        prev_tab,
        open_search,
        toggle_visibility,
    };

    struct HostEventMessage final
    {
        HostEvent event{ HostEvent::switch_tab };

        // One-based; meaningful for `switch_tab` only.
        int tab_index{ 0 };

        [[nodiscard]] friend constexpr bool operator==(const HostEventMessage&, const HostEventMessage&) noexcept = default;
    };

    [[nodiscard]] constexpr std::wstring_view wire_name(const HostEvent event) noexcept
    {
        switch (event)
        {
        case HostEvent::switch_tab:
            return L"switch-tab";
        case HostEvent::close_current_tab:
            return L"close-current-tab";
        case HostEvent::next_tab:
            return L"next-tab";
        case HostEvent::prev_tab:
            return L"prev-tab";
        case HostEvent::open_search:
            return L"open-search";
        case HostEvent::toggle_visibility:
            return L"toggle-visibility";
        }
        return L"unknown";
    }

    // Accelerator strings as the hub writes them, e.g. `alt+digit3`,
    // `control+shift+tab`. Matching ignores case; unmapped text yields
    // `std::nullopt`.
    [[nodiscard]] std::optional<HostEventMessage> parse_shortcut(std::wstring_view shortcut);

    // Inverse direction for host frame key-downs: `VK_*` plus modifier state
    // to the accelerator text `parse_shortcut` understands. Keys without a
    // name (function keys, punctuation) yield `std::nullopt`.
    [[nodiscard]] std::optional<std::wstring> format_accelerator(UINT virtual_key, bool control, bool shift, bool alt);

    class HostEventSink
    {
    public:
        virtual ~HostEventSink() = default;

        virtual void emit(const HostEventMessage& message) = 0;
    };
}
