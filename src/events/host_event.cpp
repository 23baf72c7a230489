#include "events/host_event.hpp"

#include <string>

namespace wh::events
{
    namespace
    {
        constexpr std::wstring_view kDigitShortcutPrefix = L"alt+digit";

        [[nodiscard]] std::wstring to_lower_ascii(const std::wstring_view text)
        {
            std::wstring lowered(text);
            for (wchar_t& ch : lowered)
            {
                if (ch >= L'A' && ch <= L'Z')
                {
                    ch = static_cast<wchar_t>(ch - L'A' + L'a');
                }
            }
            return lowered;
        }
    }

    std::optional<HostEventMessage> parse_shortcut(const std::wstring_view shortcut)
    {
        const std::wstring key = to_lower_ascii(shortcut);

        if (key.starts_with(kDigitShortcutPrefix) && key.size() == kDigitShortcutPrefix.size() + 1)
        {
            const wchar_t digit = key.back();
            if (digit >= L'1' && digit <= L'9')
            {
                return HostEventMessage{ .event = HostEvent::switch_tab, .tab_index = digit - L'0' };
            }
            return std::nullopt;
        }

        if (key == L"control+keyw")
        {
            return HostEventMessage{ .event = HostEvent::close_current_tab };
        }
        if (key == L"control+tab")
        {
            return HostEventMessage{ .event = HostEvent::next_tab };
        }
        if (key == L"shift+control+tab" || key == L"control+shift+tab")
        {
            return HostEventMessage{ .event = HostEvent::prev_tab };
        }
        if (key == L"control+keyk")
        {
            return HostEventMessage{ .event = HostEvent::open_search };
        }
        if (key == L"alt+space")
        {
            return HostEventMessage{ .event = HostEvent::toggle_visibility };
        }
        return std::nullopt;
    }

    std::optional<std::wstring> format_accelerator(const UINT virtual_key, const bool control, const bool shift, const bool alt)
    {
        std::wstring key_name;
        if (virtual_key >= '0' && virtual_key <= '9')
        {
            key_name = L"digit";
            key_name.push_back(static_cast<wchar_t>(virtual_key));
        }
        else if (virtual_key >= 'A' && virtual_key <= 'Z')
        {
            key_name = L"key";
            key_name.push_back(static_cast<wchar_t>(virtual_key - 'A' + L'a'));
        }
        else if (virtual_key == VK_TAB)
        {
            key_name = L"tab";
        }
        else if (virtual_key == VK_SPACE)
        {
            key_name = L"space";
        }
        else
        {
            return std::nullopt;
        }

        std::wstring accelerator;
        if (control)
        {
            accelerator.append(L"control+");
        }
        if (shift)
        {
            accelerator.append(L"shift+");
        }
        if (alt)
        {
            accelerator.append(L"alt+");
        }
        accelerator.append(key_name);
        return accelerator;
    }
}
