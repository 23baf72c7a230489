#pragma once

#include <Windows.h>

namespace wh::core
{
    // Win32 error codes thrown when the message pump cannot continue.
    // Everything else reports failures through `std::expected`.
    enum class Win32Error : DWORD
    {
        success = ERROR_SUCCESS,
    };

    [[nodiscard]] constexpr DWORD to_dword(const Win32Error error) noexcept
    {
        return static_cast<DWORD>(error);
    }

    [[nodiscard]] constexpr Win32Error from_dword(const DWORD error) noexcept
    {
        return static_cast<Win32Error>(error);
    }

    [[noreturn]] inline void throw_last_error()
    {
        throw from_dword(::GetLastError());
    }
}
