#include "cli/host_arguments.hpp"

#include "core/assert.hpp"
#include "core/unique_resource.hpp"
#include "serialization/number_text.hpp"

#include <shellapi.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <new>

namespace wh::cli
{
    std::expected<HostArguments, ParseError> HostArguments::parse(const std::wstring_view command_line) noexcept
    {
        HostArguments result;
        if (command_line.empty())
        {
            return result;
        }

        try
        {
            const std::wstring terminated(command_line);
            int argc = 0;
            core::UniqueLocalPtr argv(::CommandLineToArgvW(terminated.c_str(), &argc));
            if (!argv)
            {
                return std::unexpected(ParseError{ .message = L"CommandLineToArgvW failed" });
            }

            std::vector<std::wstring> args;
            args.reserve(argc > 0 ? static_cast<size_t>(argc) - 1 : 0);

            auto** argv_values = argv.as<wchar_t*>();
            for (int index = 1; index < argc; ++index)
            {
                args.emplace_back(argv_values[index]);
            }

            if (auto parse_result = result.parse_tokens(args); !parse_result)
            {
                return std::unexpected(parse_result.error());
            }
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ParseError{ .message = L"Out of memory while parsing the command line" });
        }

        return result;
    }

    std::expected<void, ParseError> HostArguments::parse_tokens(std::vector<std::wstring>& args) noexcept
    {
        while (!args.empty())
        {
            const std::wstring arg = args.front();

            if (arg == embed_arg)
            {
                auto value = get_string_argument(args, 0);
                if (!value)
                {
                    return std::unexpected(value.error());
                }

                auto window = parse_window_arg(value.value());
                if (!window)
                {
                    return std::unexpected(window.error());
                }

                if (std::ranges::find(_windows_to_embed, window.value()) == _windows_to_embed.end())
                {
                    _windows_to_embed.push_back(window.value());
                }
                continue;
            }

            if (arg == list_arg)
            {
                _list_requested = true;
                consume_arg(args, 0);
                continue;
            }

            if (arg == top_offset_arg)
            {
                auto value = get_string_argument(args, 0);
                if (!value)
                {
                    return std::unexpected(value.error());
                }

                auto parsed = serialization::parse_i32(value.value());
                if (!parsed || *parsed < 0)
                {
                    return std::unexpected(ParseError{ .message = L"--top-offset expects a non-negative pixel count" });
                }
                _top_offset = *parsed;
                continue;
            }

            return std::unexpected(ParseError{ .message = L"Unknown argument: " + arg });
        }

        return {};
    }

    const std::vector<core::WindowHandle>& HostArguments::windows_to_embed() const noexcept
    {
        return _windows_to_embed;
    }

    bool HostArguments::list_requested() const noexcept
    {
        return _list_requested;
    }

    std::optional<int> HostArguments::top_offset() const noexcept
    {
        return _top_offset;
    }

    void HostArguments::consume_arg(std::vector<std::wstring>& args, const size_t index)
    {
        WH_ASSERT(index < args.size());
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(index));
    }

    std::expected<std::wstring, ParseError> HostArguments::get_string_argument(std::vector<std::wstring>& args, const size_t index) noexcept
    {
        if (index + 1 >= args.size())
        {
            return std::unexpected(ParseError{ .message = L"Expected value after " + args[index] });
        }

        consume_arg(args, index);
        std::wstring value = std::move(args[index]);
        consume_arg(args, index);
        return value;
    }

    std::expected<core::WindowHandle, ParseError> HostArguments::parse_window_arg(const std::wstring_view text) noexcept
    {
        const auto parsed = serialization::parse_hex_u64(text, true);
        if (!parsed || *parsed == 0 || *parsed > std::numeric_limits<std::uintptr_t>::max())
        {
            return std::unexpected(ParseError{ .message = L"Invalid window handle value" });
        }
        return core::WindowHandle::from_uintptr(static_cast<std::uintptr_t>(*parsed));
    }
}
