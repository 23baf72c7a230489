#include "events/host_event.hpp"

namespace
{
    using wh::events::HostEvent;
    using wh::events::HostEventMessage;
    using wh::events::parse_shortcut;

    bool test_digit_shortcuts_switch_tabs()
    {
        for (int digit = 1; digit <= 9; ++digit)
        {
            const std::wstring text = L"alt+digit" + std::to_wstring(digit);
            const auto parsed = parse_shortcut(text);
            if (!parsed || *parsed != HostEventMessage{ .event = HostEvent::switch_tab, .tab_index = digit })
            {
                return false;
            }
        }
        return !parse_shortcut(L"alt+digit0") && !parse_shortcut(L"alt+digit10");
    }

    bool test_named_shortcuts()
    {
        const auto event_of = [](const std::wstring_view text) {
            const auto parsed = parse_shortcut(text);
            return parsed ? parsed->event : HostEvent::switch_tab;
        };

        return event_of(L"control+keyw") == HostEvent::close_current_tab &&
               event_of(L"control+tab") == HostEvent::next_tab &&
               event_of(L"shift+control+tab") == HostEvent::prev_tab &&
               event_of(L"control+shift+tab") == HostEvent::prev_tab &&
               event_of(L"control+keyk") == HostEvent::open_search &&
               event_of(L"alt+space") == HostEvent::toggle_visibility;
    }

    bool test_matching_ignores_case()
    {
        const auto parsed = parse_shortcut(L"Control+Shift+Tab");
        return parsed && parsed->event == HostEvent::prev_tab && parse_shortcut(L"ALT+DIGIT2").has_value();
    }

    bool test_unmapped_shortcuts()
    {
        return !parse_shortcut(L"") &&
               !parse_shortcut(L"control+keyq") &&
               !parse_shortcut(L"alt+tab") &&
               !parse_shortcut(L"control+digit1");
    }

    bool test_wire_names_are_stable()
    {
        return wh::events::wire_name(HostEvent::switch_tab) == L"switch-tab" &&
               wh::events::wire_name(HostEvent::close_current_tab) == L"close-current-tab" &&
               wh::events::wire_name(HostEvent::next_tab) == L"next-tab" &&
               wh::events::wire_name(HostEvent::prev_tab) == L"prev-tab" &&
               wh::events::wire_name(HostEvent::open_search) == L"open-search" &&
               wh::events::wire_name(HostEvent::toggle_visibility) == L"toggle-visibility";
    }

    bool test_accelerator_formatting_feeds_parser()
    {
        const auto digit = wh::events::format_accelerator('3', false, false, true);
        const auto prev = wh::events::format_accelerator(VK_TAB, true, true, false);
        const auto close = wh::events::format_accelerator('W', true, false, false);
        const auto toggle = wh::events::format_accelerator(VK_SPACE, false, false, true);

        return digit && *digit == L"alt+digit3" &&
               prev && *prev == L"control+shift+tab" &&
               close && *close == L"control+keyw" &&
               toggle && parse_shortcut(*toggle)->event == HostEvent::toggle_visibility &&
               !wh::events::format_accelerator(VK_F5, true, false, false);
    }
}

bool run_host_event_tests()
{
    return test_digit_shortcuts_switch_tabs() &&
           test_named_shortcuts() &&
           test_matching_ignores_case() &&
           test_unmapped_shortcuts() &&
           test_wire_names_are_stable() &&
           test_accelerator_formatting_feeds_parser();
}
