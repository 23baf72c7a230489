#include "localization/localizer.hpp"

namespace wh::localization
{
    Localizer::Localizer(std::wstring locale) :
        _locale(std::move(locale))
    {
        if (_locale.empty())
        {
            _locale = detect_user_locale();
        }

        _use_simplified_chinese = _locale.starts_with(L"zh");
    }

    const std::wstring& Localizer::locale() const noexcept
    {
        return _locale;
    }

    std::wstring_view Localizer::text(const StringId id) const noexcept
    {
        if (_use_simplified_chinese)
        {
            switch (id)
            {
            case StringId::startup:
                return L"窗口集线器启动";
            case StringId::shutdown:
                return L"窗口集线器退出，已释放全部嵌入窗口";
            case StringId::parse_failed:
                return L"命令行参数解析失败";
            case StringId::config_failed:
                return L"配置加载失败";
            case StringId::host_frame_failed:
                return L"无法创建主窗口";
            case StringId::embed_at_startup_failed:
                return L"启动时嵌入窗口失败";
            case StringId::error_unsupported:
                return L"当前平台不支持此操作";
            case StringId::error_no_host_frame:
                return L"主窗口尚未创建";
            case StringId::error_self_process:
                return L"不能嵌入自身";
            case StringId::error_forbidden_class:
                return L"不支持嵌入此类型窗口";
            case StringId::error_already_embedded:
                return L"窗口已嵌入";
            case StringId::error_gone:
                return L"窗口已不存在";
            case StringId::error_os_failure:
                return L"系统调用失败";
            default:
                return L"未知消息";
            }
        }

        switch (id)
        {
        case StringId::startup:
            return L"Window hub starting";
        case StringId::shutdown:
            return L"Window hub exiting; all embedded windows released";
        case StringId::parse_failed:
            return L"Command line parsing failed";
        case StringId::config_failed:
            return L"Configuration loading failed";
        case StringId::host_frame_failed:
            return L"The main window could not be created";
        case StringId::embed_at_startup_failed:
            return L"Embedding a window at startup failed";
        case StringId::error_unsupported:
            return L"This operation is not supported on this platform";
        case StringId::error_no_host_frame:
            return L"The main window has not been created yet";
        case StringId::error_self_process:
            return L"A window of this application cannot be embedded";
        case StringId::error_forbidden_class:
            return L"Windows of this type cannot be embedded";
        case StringId::error_already_embedded:
            return L"The window is already embedded";
        case StringId::error_gone:
            return L"The window no longer exists";
        case StringId::error_os_failure:
            return L"A system call failed";
        default:
            return L"Unknown message";
        }
    }

    std::wstring Localizer::detect_user_locale()
    {
        wchar_t locale_buffer[LOCALE_NAME_MAX_LENGTH]{};
        const int size = ::GetUserDefaultLocaleName(locale_buffer, LOCALE_NAME_MAX_LENGTH);
        if (size <= 0)
        {
            return L"en-US";
        }
        return std::wstring(locale_buffer, locale_buffer + size - 1);
    }
}
