#pragma once

#include <Windows.h>

#include <cwchar>

namespace wh::core
{
    inline void fail_fast_assert(const wchar_t* expression, const wchar_t* file, const unsigned line) noexcept
    {
        wchar_t buffer[768]{};
        _snwprintf_s(
            buffer,
            _TRUNCATE,
            L"[windowhub] assertion failed: %ls (%ls:%u)\n",
            expression,
            file,
            line);
        ::OutputDebugStringW(buffer);
        __fastfail(FAST_FAIL_FATAL_APP_EXIT);
    }
}

#define WH_WIDEN_INNER(value) L##value
#define WH_WIDEN(value) WH_WIDEN_INNER(value)
#define WH_ASSERT(expr) ((expr) ? static_cast<void>(0) : ::wh::core::fail_fast_assert(WH_WIDEN(#expr), WH_WIDEN(__FILE__), __LINE__))
