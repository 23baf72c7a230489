#pragma once

#include <Windows.h>

#include <string>
#include <string_view>

namespace wh::localization
{
    enum class StringId
    {
        startup,
        shutdown,
        parse_failed,
        config_failed,
        host_frame_failed,
        embed_at_startup_failed,
        error_unsupported,
        error_no_host_frame,
        error_self_process,
        error_forbidden_class,
        error_already_embedded,
        error_gone,
        error_os_failure,
    };

    class Localizer final
    {
    public:
        explicit Localizer(std::wstring locale);

        [[nodiscard]] const std::wstring& locale() const noexcept;
        [[nodiscard]] std::wstring_view text(StringId id) const noexcept;
        [[nodiscard]] static std::wstring detect_user_locale();

    private:
        bool _use_simplified_chinese{ false };
        std::wstring _locale;
    };
}
