#include "app/application.hpp"

#include "core/error_output.hpp"
#include "core/exception.hpp"

#include <Windows.h>

#include <cwchar>
#include <exception>

int WINAPI wWinMain(HINSTANCE /*instance*/, HINSTANCE /*prev_instance*/, PWSTR /*command_line*/, int /*show_command*/)
{
    try
    {
        wh::app::Application application;
        return application.run();
    }
    catch (const wh::core::Win32Error error)
    {
        wchar_t message[512]{};
        const DWORD code = wh::core::to_dword(error);
        _snwprintf_s(
            message,
            _TRUNCATE,
            L"Unhandled Win32 error=%lu",
            static_cast<unsigned long>(code));
        wh::core::write_error_line(message);
        return static_cast<int>(code == 0 ? ERROR_GEN_FAILURE : code);
    }
    catch (const std::exception&)
    {
        wh::core::write_error_line(L"Unhandled standard exception");
        return static_cast<int>(ERROR_UNHANDLED_EXCEPTION);
    }
}
