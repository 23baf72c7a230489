#pragma once

// A non-owning identity of a Win32 window.
//
// `HWND` values are assigned and recycled by the window manager; this type
// only compares them. It never destroys a window, and a `WindowHandle` may
// outlive the window it names (use `NativeWindows::is_valid` to find out).
//
// The command surface exchanges handles with the UI as plain integers, so
// the type round-trips through `std::uintptr_t` losslessly.

#include <Windows.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace wh::core
{
    class WindowHandle final
    {
    public:
        constexpr WindowHandle() noexcept = default;

        explicit constexpr WindowHandle(const HWND value) noexcept :
            _value(value)
        {
        }

        [[nodiscard]] static WindowHandle from_uintptr(const std::uintptr_t value) noexcept
        {
            return WindowHandle(reinterpret_cast<HWND>(value));
        }

        [[nodiscard]] constexpr HWND get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] std::uintptr_t as_uintptr() const noexcept
        {
            return reinterpret_cast<std::uintptr_t>(_value);
        }

        [[nodiscard]] constexpr bool empty() const noexcept
        {
            return _value == nullptr;
        }

        [[nodiscard]] explicit constexpr operator bool() const noexcept
        {
            return !empty();
        }

        [[nodiscard]] friend constexpr bool operator==(WindowHandle, WindowHandle) noexcept = default;

    private:
        HWND _value{ nullptr };
    };

    static_assert(sizeof(WindowHandle) == sizeof(HWND), "WindowHandle must remain layout-compatible with HWND");
    static_assert(std::is_trivially_copyable_v<WindowHandle>, "WindowHandle must remain trivially copyable");
}

namespace std
{
    template<>
    struct hash<wh::core::WindowHandle>
    {
        [[nodiscard]] size_t operator()(const wh::core::WindowHandle handle) const noexcept
        {
            return hash<uintptr_t>{}(handle.as_uintptr());
        }
    };
}
