#include "serialization/number_text.hpp"

#include <limits>

namespace wh::serialization
{
    namespace
    {
        [[nodiscard]] constexpr NumberError make_error(const NumberErrorCode code) noexcept
        {
            return NumberError{ .code = code };
        }

        [[nodiscard]] constexpr int digit_value(const wchar_t ch, const unsigned radix) noexcept
        {
            int value = -1;
            if (ch >= L'0' && ch <= L'9')
            {
                value = ch - L'0';
            }
            else if (ch >= L'a' && ch <= L'f')
            {
                value = 10 + (ch - L'a');
            }
            else if (ch >= L'A' && ch <= L'F')
            {
                value = 10 + (ch - L'A');
            }
            return value >= 0 && static_cast<unsigned>(value) < radix ? value : -1;
        }

        // Accumulates an unsigned magnitude, failing once it exceeds `limit`.
        [[nodiscard]] std::expected<std::uint64_t, NumberError> accumulate(
            const std::wstring_view digits,
            const unsigned radix,
            const std::uint64_t limit,
            const NumberErrorCode overflow_code) noexcept
        {
            if (digits.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::empty_input));
            }

            std::uint64_t accumulator = 0;
            for (const wchar_t ch : digits)
            {
                const int digit = digit_value(ch, radix);
                if (digit < 0)
                {
                    return std::unexpected(make_error(NumberErrorCode::invalid_character));
                }

                if (accumulator > (limit - static_cast<std::uint64_t>(digit)) / radix)
                {
                    return std::unexpected(make_error(overflow_code));
                }
                accumulator = accumulator * radix + static_cast<std::uint64_t>(digit);
            }
            return accumulator;
        }
    }

    std::expected<std::int32_t, NumberError> parse_i32(std::wstring_view text) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        bool negative = false;
        if (text.front() == L'+' || text.front() == L'-')
        {
            negative = text.front() == L'-';
            text.remove_prefix(1);
            if (text.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }
        }

        constexpr std::uint64_t max_positive = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
        const auto magnitude = accumulate(
            text,
            10,
            negative ? max_positive + 1 : max_positive,
            negative ? NumberErrorCode::underflow : NumberErrorCode::overflow);
        if (!magnitude)
        {
            return std::unexpected(magnitude.error());
        }

        if (!negative)
        {
            return static_cast<std::int32_t>(*magnitude);
        }
        return static_cast<std::int32_t>(-static_cast<std::int64_t>(*magnitude));
    }

    std::expected<std::uint32_t, NumberError> parse_u32(std::wstring_view text) noexcept
    {
        if (!text.empty() && text.front() == L'+')
        {
            text.remove_prefix(1);
            if (text.empty())
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }
        }

        const auto value = accumulate(text, 10, std::numeric_limits<std::uint32_t>::max(), NumberErrorCode::overflow);
        if (!value)
        {
            return std::unexpected(value.error());
        }
        return static_cast<std::uint32_t>(*value);
    }

    std::expected<std::uint64_t, NumberError> parse_hex_u64(std::wstring_view text, const bool require_prefix) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        const bool has_prefix = text.size() >= 2 && text[0] == L'0' && (text[1] == L'x' || text[1] == L'X');
        if (has_prefix)
        {
            text.remove_prefix(2);
        }
        else if (require_prefix)
        {
            return std::unexpected(make_error(NumberErrorCode::missing_prefix));
        }

        return accumulate(text, 16, std::numeric_limits<std::uint64_t>::max(), NumberErrorCode::overflow);
    }
}
