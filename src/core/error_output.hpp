#pragma once

#include <Windows.h>

#include <string>
#include <string_view>

namespace wh::core
{
    // The host is a GUI subsystem executable: stderr is only present when a
    // parent redirected it (scripts, the test runner). Fall back to the
    // debugger channel so fatal startup messages are never lost.
    inline void write_error_line(const std::wstring_view message) noexcept
    {
        const HANDLE stream = ::GetStdHandle(STD_ERROR_HANDLE);
        if (stream == nullptr || stream == INVALID_HANDLE_VALUE)
        {
            std::wstring line(message);
            line.append(L"\n");
            ::OutputDebugStringW(line.c_str());
            return;
        }

        DWORD mode = 0;
        DWORD written = 0;
        if (::GetConsoleMode(stream, &mode) != FALSE)
        {
            ::WriteConsoleW(stream, message.data(), static_cast<DWORD>(message.size()), &written, nullptr);
            ::WriteConsoleW(stream, L"\r\n", 2, &written, nullptr);
            return;
        }

        ::WriteFile(stream, message.data(), static_cast<DWORD>(message.size() * sizeof(wchar_t)), &written, nullptr);
        ::WriteFile(stream, L"\r\n", static_cast<DWORD>(2 * sizeof(wchar_t)), &written, nullptr);
    }
}
