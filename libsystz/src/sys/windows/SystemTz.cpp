#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Globalization.h>

#include <libsystz/Helpers/StringHelpers.h>
#include <libsystz/SystemTz.h>
#include <libsystz/TzException.h>
#include <libsystz/WindowsTz.h>

namespace LibSysTz
{
    static bool debugEnabled()
    {
        return SystemTzDebugEnabled(getenv("SYSTZ_DEBUG"));
    }

    // Windows 10 and later answer with an IANA name here.
    static std::optional<Tz> systemtz_from_calendar()
    {
        try
        {
            winrt::Windows::Globalization::Calendar calendar;
            std::string name = winrt::to_string(calendar.GetTimeZone());

            auto tz = Tz::TryParseInsensitive(name);
            if (!tz.has_value() && debugEnabled())
            {
                std::cerr << "systz: Calendar: ignoring unknown time zone \"" << name << "\"" << std::endl;
            }
            return tz;
        }
        catch (const winrt::hresult_error& e)
        {
            if (debugEnabled())
            {
                std::cerr << "systz: Calendar: " << winrt::to_string(e.message()) << std::endl;
            }
            return std::nullopt;
        }
    }

    // Reference: https://learn.microsoft.com/en-us/windows/win32/api/timezoneapi/nf-timezoneapi-getdynamictimezoneinformation
    static std::optional<Tz> systemtz_from_timezone_information()
    {
        DYNAMIC_TIME_ZONE_INFORMATION info = {};
        DWORD result = GetDynamicTimeZoneInformation(&info);
        if (result == TIME_ZONE_ID_INVALID)
        {
            if (debugEnabled())
            {
                std::cerr << "systz: GetDynamicTimeZoneInformation() failed: " << GetLastError() << std::endl;
            }
            return std::nullopt;
        }

        static_assert(sizeof(WCHAR) == sizeof(char16_t));
        std::string keyName = Helpers::fromUtf16(
            reinterpret_cast<const char16_t*>(info.TimeZoneKeyName),
            sizeof(info.TimeZoneKeyName) / sizeof(info.TimeZoneKeyName[0]));

        const WindowsTz* zone = WindowsTz::Get(keyName);
        if (zone == nullptr)
        {
            if (debugEnabled())
            {
                std::cerr << "systz: \"" << keyName << "\" is not in the windowsZones dataset" << std::endl;
            }
            return std::nullopt;
        }

        return zone->ToTz();
    }

    std::optional<Tz> SystemTz()
    {
        try
        {
            auto tz = systemtz_from_calendar();
            if (tz.has_value())
            {
                return tz;
            }
            return systemtz_from_timezone_information();
        }
        catch (const TzException& e)
        {
            if (debugEnabled())
            {
                std::cerr << "systz: " << e.what() << std::endl;
            }
            return std::nullopt;
        }
    }
}
