#include "config/app_config.hpp"

#include "core/environment.hpp"
#include "core/unique_resource.hpp"
#include "serialization/number_text.hpp"

#include <Windows.h>

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

namespace wh::config
{
    namespace
    {
        constexpr std::wstring_view kConfigPathEnv = L"WINDOWHUB_CONFIG";

        struct EnvironmentOverride final
        {
            std::wstring_view variable;
            std::wstring_view key;
        };

        // Every file key can be overridden by its upper-case `WINDOWHUB_`
        // counterpart.
        constexpr std::array<EnvironmentOverride, 11> kEnvironmentOverrides{ {
            { L"WINDOWHUB_LOCALE", L"locale" },
            { L"WINDOWHUB_LOG_LEVEL", L"log_level" },
            { L"WINDOWHUB_DEBUG_SINK", L"debug_sink" },
            { L"WINDOWHUB_FILE_LOGGING", L"file_logging" },
            { L"WINDOWHUB_LOG_DIRECTORY", L"log_directory" },
            { L"WINDOWHUB_PRODUCT_NAME", L"product_name" },
            { L"WINDOWHUB_FOCUS_DETACH_DELAY_MS", L"focus_detach_delay_ms" },
            { L"WINDOWHUB_MIN_WINDOW_WIDTH", L"min_window_width" },
            { L"WINDOWHUB_MIN_WINDOW_HEIGHT", L"min_window_height" },
            { L"WINDOWHUB_CONTENT_TOP_OFFSET", L"content_top_offset" },
            { L"WINDOWHUB_VALIDITY_POLL_MS", L"validity_poll_ms" },
        } };

        [[nodiscard]] std::wstring trim(std::wstring value)
        {
            auto not_space = [](const wchar_t ch) {
                return ch != L' ' && ch != L'\t' && ch != L'\r' && ch != L'\n';
            };

            auto begin_it = std::find_if(value.begin(), value.end(), not_space);
            if (begin_it == value.end())
            {
                return {};
            }

            auto end_it = std::find_if(value.rbegin(), value.rend(), not_space).base();
            return std::wstring(begin_it, end_it);
        }

        [[nodiscard]] bool parse_bool(const std::wstring_view text)
        {
            return text == L"1" || text == L"true" || text == L"TRUE" || text == L"on" || text == L"ON";
        }

        [[nodiscard]] DWORD parse_dword_or_default(const std::wstring_view text, const DWORD fallback)
        {
            const auto parsed = serialization::parse_u32(text);
            if (!parsed)
            {
                return fallback;
            }
            return *parsed;
        }

        // Pixel settings never go negative; a negative value keeps the default.
        [[nodiscard]] int parse_pixels_or_default(const std::wstring_view text, const int fallback)
        {
            const auto parsed = serialization::parse_i32(text);
            if (!parsed || *parsed < 0)
            {
                return fallback;
            }
            return *parsed;
        }

        [[nodiscard]] std::expected<std::wstring, ConfigError> read_config_file(const std::wstring& path) noexcept
        {
            core::UniqueHandle file(::CreateFileW(
                path.c_str(),
                GENERIC_READ,
                FILE_SHARE_READ,
                nullptr,
                OPEN_EXISTING,
                FILE_ATTRIBUTE_NORMAL,
                nullptr));
            if (!file.valid())
            {
                return std::unexpected(ConfigError{
                    .message = L"CreateFileW failed for config path",
                    .win32_error = ::GetLastError(),
                });
            }

            LARGE_INTEGER file_size{};
            if (::GetFileSizeEx(file.get(), &file_size) == FALSE)
            {
                return std::unexpected(ConfigError{
                    .message = L"GetFileSizeEx failed for config path",
                    .win32_error = ::GetLastError(),
                });
            }

            if (file_size.QuadPart < 0 || file_size.QuadPart > 256 * 1024)
            {
                return std::unexpected(ConfigError{
                    .message = L"Config file size is invalid",
                    .win32_error = ERROR_FILE_TOO_LARGE,
                });
            }

            const DWORD bytes_to_read = static_cast<DWORD>(file_size.QuadPart);
            std::vector<char> bytes(bytes_to_read);
            if (bytes_to_read > 0)
            {
                DWORD bytes_read = 0;
                if (::ReadFile(file.get(), bytes.data(), bytes_to_read, &bytes_read, nullptr) == FALSE || bytes_read != bytes_to_read)
                {
                    return std::unexpected(ConfigError{
                        .message = L"ReadFile failed for config path",
                        .win32_error = ::GetLastError(),
                    });
                }
            }

            if (bytes.size() >= 2 &&
                static_cast<unsigned char>(bytes[0]) == 0xFF &&
                static_cast<unsigned char>(bytes[1]) == 0xFE)
            {
                const size_t wchar_count = (bytes.size() - 2) / sizeof(wchar_t);
                const wchar_t* start = reinterpret_cast<const wchar_t*>(bytes.data() + 2);
                return std::wstring(start, start + wchar_count);
            }

            size_t offset = 0;
            if (bytes.size() >= 3 &&
                static_cast<unsigned char>(bytes[0]) == 0xEF &&
                static_cast<unsigned char>(bytes[1]) == 0xBB &&
                static_cast<unsigned char>(bytes[2]) == 0xBF)
            {
                offset = 3;
            }

            if (bytes.size() == offset)
            {
                return std::wstring{};
            }

            const char* utf8 = bytes.data() + offset;
            const int utf8_length = static_cast<int>(bytes.size() - offset);
            const int wide_length = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8, utf8_length, nullptr, 0);
            if (wide_length <= 0)
            {
                return std::unexpected(ConfigError{
                    .message = L"Config is not UTF-8/UTF-16LE text",
                    .win32_error = ::GetLastError(),
                });
            }

            std::wstring wide(static_cast<size_t>(wide_length), L'\0');
            const int converted = ::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, utf8, utf8_length, wide.data(), wide_length);
            if (converted != wide_length)
            {
                return std::unexpected(ConfigError{
                    .message = L"Failed to convert config file text",
                    .win32_error = ::GetLastError(),
                });
            }

            return wide;
        }

        void apply_key_value(AppConfig& config, std::wstring key, std::wstring value)
        {
            key = trim(std::move(key));
            value = trim(std::move(value));

            if (key == L"locale")
            {
                config.locale_override = std::move(value);
                return;
            }
            if (key == L"log_level")
            {
                config.minimum_log_level = logging::parse_log_level(value).value_or(logging::LogLevel::info);
                return;
            }
            if (key == L"debug_sink")
            {
                config.enable_debug_sink = parse_bool(value);
                return;
            }
            if (key == L"file_logging")
            {
                config.enable_file_logging = parse_bool(value);
                return;
            }
            if (key == L"log_directory")
            {
                config.log_directory = std::move(value);
                return;
            }
            if (key == L"product_name")
            {
                if (!value.empty())
                {
                    config.product_name = std::move(value);
                }
                return;
            }
            if (key == L"focus_detach_delay_ms")
            {
                config.focus_detach_delay_ms = parse_dword_or_default(value, config.focus_detach_delay_ms);
                return;
            }
            if (key == L"min_window_width")
            {
                config.min_window_width = parse_pixels_or_default(value, config.min_window_width);
                return;
            }
            if (key == L"min_window_height")
            {
                config.min_window_height = parse_pixels_or_default(value, config.min_window_height);
                return;
            }
            if (key == L"content_top_offset")
            {
                config.content_top_offset = parse_pixels_or_default(value, config.content_top_offset);
                return;
            }
            if (key == L"validity_poll_ms")
            {
                config.validity_poll_ms = parse_dword_or_default(value, config.validity_poll_ms);
            }
        }

        void apply_environment_overrides(AppConfig& config)
        {
            for (const auto& entry : kEnvironmentOverrides)
            {
                if (auto value = core::read_environment(entry.variable))
                {
                    apply_key_value(config, std::wstring(entry.key), std::move(*value));
                }
            }
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::load() noexcept
    {
        AppConfig config{};

        if (const auto config_path = core::read_environment(kConfigPathEnv))
        {
            auto file_text = read_config_file(*config_path);
            if (!file_text)
            {
                return std::unexpected(file_text.error());
            }

            auto parsed = parse_text(file_text.value());
            if (!parsed)
            {
                return std::unexpected(parsed.error());
            }
            config = std::move(parsed.value());
        }

        apply_environment_overrides(config);
        return config;
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::parse_text(const std::wstring_view text) noexcept
    {
        AppConfig config{};
        size_t begin = 0;

        while (begin < text.size())
        {
            size_t end = text.find(L'\n', begin);
            if (end == std::wstring_view::npos)
            {
                end = text.size();
            }

            std::wstring line(text.substr(begin, end - begin));
            line = trim(std::move(line));
            if (!line.empty() && !line.starts_with(L"#") && !line.starts_with(L";"))
            {
                const size_t equals_index = line.find(L'=');
                if (equals_index == std::wstring::npos)
                {
                    return std::unexpected(ConfigError{
                        .message = L"Invalid config line (missing '=')",
                        .win32_error = ERROR_BAD_FORMAT,
                    });
                }

                apply_key_value(config, line.substr(0, equals_index), line.substr(equals_index + 1));
            }

            begin = end + 1;
        }

        return config;
    }
}
