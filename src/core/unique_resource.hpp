#pragma once

// Move-only owners for the two kinds of raw Win32 resources the window hub
// holds: kernel handles (`CloseHandle`) and `LocalAlloc` blocks returned by
// shell helpers such as `CommandLineToArgvW` (`LocalFree`).
//
// Window handles are never owned here. The OS destroys foreign windows; see
// `core::WindowHandle` for the non-owning window identity.

#include <Windows.h>

namespace wh::core
{
    template<typename Traits>
    class UniqueResource final
    {
    public:
        using value_type = typename Traits::value_type;

        UniqueResource() noexcept = default;

        explicit UniqueResource(value_type value) noexcept :
            _value(value)
        {
        }

        ~UniqueResource() noexcept
        {
            reset();
        }

        UniqueResource(const UniqueResource&) = delete;
        UniqueResource& operator=(const UniqueResource&) = delete;

        UniqueResource(UniqueResource&& other) noexcept :
            _value(other.release())
        {
        }

        UniqueResource& operator=(UniqueResource&& other) noexcept
        {
            if (this != &other)
            {
                reset(other.release());
            }
            return *this;
        }

        [[nodiscard]] value_type get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] value_type* put() noexcept
        {
            reset();
            return &_value;
        }

        template<typename T>
        [[nodiscard]] T* as() const noexcept
        {
            return static_cast<T*>(_value);
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return Traits::is_valid(_value);
        }

        [[nodiscard]] explicit operator bool() const noexcept
        {
            return valid();
        }

        value_type release() noexcept
        {
            value_type detached = _value;
            _value = Traits::invalid();
            return detached;
        }

        void reset(value_type replacement = Traits::invalid()) noexcept
        {
            if (Traits::is_valid(_value))
            {
                Traits::close(_value);
            }
            _value = replacement;
        }

    private:
        value_type _value{ Traits::invalid() };
    };

    struct KernelHandleTraits final
    {
        using value_type = HANDLE;

        [[nodiscard]] static constexpr HANDLE invalid() noexcept
        {
            return nullptr;
        }

        [[nodiscard]] static bool is_valid(const HANDLE value) noexcept
        {
            return value != nullptr && value != INVALID_HANDLE_VALUE;
        }

        static void close(const HANDLE value) noexcept
        {
            ::CloseHandle(value);
        }
    };

    struct LocalMemoryTraits final
    {
        using value_type = void*;

        [[nodiscard]] static constexpr void* invalid() noexcept
        {
            return nullptr;
        }

        [[nodiscard]] static constexpr bool is_valid(void* const value) noexcept
        {
            return value != nullptr;
        }

        static void close(void* const value) noexcept
        {
            ::LocalFree(value);
        }
    };

    using UniqueHandle = UniqueResource<KernelHandleTraits>;
    using UniqueLocalPtr = UniqueResource<LocalMemoryTraits>;
}
