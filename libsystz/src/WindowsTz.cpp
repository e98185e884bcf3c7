#include <algorithm>
#include <string>

#include <libsystz/TzException.h>
#include <libsystz/WindowsTz.h>

namespace LibSysTz
{
    Tz WindowsTz::ToTz() const
    {
        // Every identifier was validated when the dataset was compiled.
        return Tz::Parse(iana.front());
    }

    const WindowsTz* WindowsTz::Get(std::string_view zone, std::optional<std::string_view> territory)
    {
        const auto& zones = Detail::GetWindowsZones();

        auto it = std::find_if(zones.begin(), zones.end(), [&](const WindowsTz& x)
        {
            bool res = x.zone == zone;
            if (territory.has_value())
            {
                return res && x.territory == territory;
            }
            return res;
        });

        return it != zones.end() ? &*it : nullptr;
    }

    const WindowsTz& WindowsTz::FromIana(const Tz& tz)
    {
        const auto& zones = Detail::GetWindowsZones();
        std::string_view name = tz.GetName();

        for (const auto& x : zones)
        {
            if (std::find(x.iana.begin(), x.iana.end(), name) != x.iana.end())
            {
                return x;
            }
        }

        throw UnknownTimezoneException(tz.GetName());
    }

    const std::vector<WindowsTz>& WindowsTz::GetAll()
    {
        return Detail::GetWindowsZones();
    }

    std::optional<std::chrono::sys_seconds> WindowsTz::BuildDate()
    {
        return Detail::GetWindowsZonesVersion().BuildDate;
    }

    std::optional<uint64_t> WindowsTz::Hash()
    {
        return Detail::GetWindowsZonesVersion().Hash;
    }

    std::pair<std::string_view, std::string_view> WindowsTz::Version()
    {
        return Detail::GetWindowsZonesVersion().Version;
    }
}
