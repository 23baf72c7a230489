#pragma once

#include <Windows.h>

#include <optional>
#include <string>
#include <string_view>

namespace wh::core
{
    // `std::nullopt` when the variable is unset or empty-and-unreadable.
    [[nodiscard]] inline std::optional<std::wstring> read_environment(const std::wstring_view name)
    {
        const std::wstring terminated(name);
        const DWORD required = ::GetEnvironmentVariableW(terminated.c_str(), nullptr, 0);
        if (required == 0)
        {
            return std::nullopt;
        }

        std::wstring value(required, L'\0');
        const DWORD written = ::GetEnvironmentVariableW(terminated.c_str(), value.data(), required);
        if (written == 0)
        {
            return std::nullopt;
        }

        value.resize(written);
        return value;
    }

    [[nodiscard]] inline std::wstring append_path_component(std::wstring base, const std::wstring_view component)
    {
        if (!base.empty())
        {
            const wchar_t tail = base.back();
            if (tail != L'\\' && tail != L'/')
            {
                base.push_back(L'\\');
            }
        }

        base.append(component);
        return base;
    }

    [[nodiscard]] inline std::optional<std::wstring> temp_directory()
    {
        std::optional<std::wstring> root = read_environment(L"TEMP");
        if (!root || root->empty())
        {
            root = read_environment(L"TMP");
        }
        if (!root || root->empty())
        {
            return std::nullopt;
        }
        return root;
    }
}
