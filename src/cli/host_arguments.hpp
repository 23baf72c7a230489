#pragma once

// CLI parser for `windowhub.exe`.
//
//   windowhub.exe [--embed 0xHWND]... [--list] [--top-offset N]
//
// `CommandLineToArgvW` is used to match Win32 tokenization rules and
// `argv[0]` is skipped. Every remaining token must be a known switch; the
// host never forwards a tail to another process.
//
// This module is pure: it validates handle syntax only, never whether the
// window exists.

#include "core/window_handle.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wh::cli
{
    struct ParseError final
    {
        std::wstring message;
    };

    class HostArguments final
    {
    public:
        static constexpr std::wstring_view embed_arg = L"--embed";
        static constexpr std::wstring_view list_arg = L"--list";
        static constexpr std::wstring_view top_offset_arg = L"--top-offset";

        [[nodiscard]] static std::expected<HostArguments, ParseError> parse(std::wstring_view command_line) noexcept;

        // In command line order, duplicates removed.
        [[nodiscard]] const std::vector<core::WindowHandle>& windows_to_embed() const noexcept;
        [[nodiscard]] bool list_requested() const noexcept;
        [[nodiscard]] std::optional<int> top_offset() const noexcept;

    private:
        HostArguments() = default;

        [[nodiscard]] std::expected<void, ParseError> parse_tokens(std::vector<std::wstring>& args) noexcept;

        static void consume_arg(std::vector<std::wstring>& args, size_t index);
        [[nodiscard]] static std::expected<std::wstring, ParseError> get_string_argument(std::vector<std::wstring>& args, size_t index) noexcept;
        [[nodiscard]] static std::expected<core::WindowHandle, ParseError> parse_window_arg(std::wstring_view text) noexcept;

        std::vector<core::WindowHandle> _windows_to_embed;
        bool _list_requested{ false };
        std::optional<int> _top_offset;
    };
}
