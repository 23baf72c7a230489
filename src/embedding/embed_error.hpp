#pragma once

// Stable error taxonomy of the embedding core.
//
// The kinds below are part of the command contract: the UI matches on
// `EmbedErrorKind` and only displays the message. New kinds may be added;
// existing ones keep their meaning.

#include "native/native_windows.hpp"

#include <Windows.h>

#include <string>
#include <string_view>

namespace wh::embedding
{
    enum class EmbedErrorKind
    {
        unsupported,
        no_host_frame,
        not_embeddable,
        // Reserved: re-embedding is reported as success.
        already_embedded,
        gone,
        os_failure,
    };

    enum class RejectReason
    {
        self_process,
        forbidden_class,
    };

    struct EmbedError final
    {
        EmbedErrorKind kind{ EmbedErrorKind::os_failure };

        // Meaningful for `not_embeddable` only.
        RejectReason reason{ RejectReason::self_process };

        // Class name for `forbidden_class`, primitive name for `os_failure`.
        std::wstring detail;

        DWORD win32_error{ ERROR_SUCCESS };
    };

    // Update and activate report a vanished window as a value, not an error.
    enum class WindowOutcome
    {
        done,
        gone,
    };

    [[nodiscard]] inline EmbedError make_os_failure(native::NativeError error)
    {
        return EmbedError{
            .kind = EmbedErrorKind::os_failure,
            .detail = std::move(error.operation),
            .win32_error = error.win32_error,
        };
    }

    [[nodiscard]] inline EmbedError make_error(const EmbedErrorKind kind)
    {
        return EmbedError{ .kind = kind };
    }

    [[nodiscard]] constexpr std::wstring_view to_string(const EmbedErrorKind kind) noexcept
    {
        switch (kind)
        {
        case EmbedErrorKind::unsupported:
            return L"Unsupported";
        case EmbedErrorKind::no_host_frame:
            return L"NoHostFrame";
        case EmbedErrorKind::not_embeddable:
            return L"NotEmbeddable";
        case EmbedErrorKind::already_embedded:
            return L"AlreadyEmbedded";
        case EmbedErrorKind::gone:
            return L"Gone";
        case EmbedErrorKind::os_failure:
            return L"OsFailure";
        }
        return L"Unknown";
    }

    [[nodiscard]] constexpr std::wstring_view to_string(const RejectReason reason) noexcept
    {
        switch (reason)
        {
        case RejectReason::self_process:
            return L"SelfProcess";
        case RejectReason::forbidden_class:
            return L"ForbiddenClass";
        }
        return L"Unknown";
    }
}
