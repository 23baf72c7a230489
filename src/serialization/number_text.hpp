#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace wh::serialization
{
    enum class NumberErrorCode
    {
        empty_input,
        invalid_character,
        missing_prefix,
        overflow,
        underflow,
    };

    struct NumberError final
    {
        NumberErrorCode code{ NumberErrorCode::invalid_character };
    };

    // Strict parsers for configuration values and command line arguments:
    // no surrounding whitespace, no trailing garbage.
    [[nodiscard]] std::expected<std::int32_t, NumberError> parse_i32(std::wstring_view text) noexcept;
    [[nodiscard]] std::expected<std::uint32_t, NumberError> parse_u32(std::wstring_view text) noexcept;

    // Hexadecimal with an optional (or, with `require_prefix`, mandatory)
    // `0x` / `0X` prefix. Used for window handle values.
    [[nodiscard]] std::expected<std::uint64_t, NumberError> parse_hex_u64(std::wstring_view text, bool require_prefix) noexcept;
}
