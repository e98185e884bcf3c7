#ifndef __LIBSYSTZ_WINDOWSTZ_H__
#define __LIBSYSTZ_WINDOWSTZ_H__

#include <cassert>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "Tz.h"

namespace LibSysTz
{
    /// <summary>
    /// Metadata about the bundled CLDR <c>windowsZones</c> dataset, recorded when the dataset was compiled.
    /// </summary>
    struct WindowsZonesVersion
    {
        std::optional<std::chrono::sys_seconds> BuildDate;
        // (otherVersion, typeVersion) as found in the source document.
        std::pair<std::string_view, std::string_view> Version;
        std::optional<uint64_t> Hash;
    };

    /// <summary>
    /// <para>A Microsoft Windows time zone known to the CLDR <c>windowsZones</c> dataset bundled at build
    /// time.</para>
    /// <para>Windows names zones after registry keys (<c>W. Europe Standard Time</c>); the dataset maps each key,
    /// optionally narrowed by territory, to one or more IANA identifiers.  The first identifier is the default
    /// mapping.</para>
    /// </summary>
    class WindowsTz
    {
    private:
        std::string_view zone;
        std::optional<std::string_view> territory;
        std::vector<std::string_view> iana;

    public:
        WindowsTz(std::string_view zone, std::optional<std::string_view> territory,
            std::initializer_list<std::string_view> iana)
            : zone(zone)
            , territory(territory)
            , iana(iana)
        {
            assert(!this->iana.empty());
        }

        std::string_view GetZone() const
        {
            return zone;
        }

        const std::optional<std::string_view>& GetTerritory() const
        {
            return territory;
        }

        const std::vector<std::string_view>& GetIana() const
        {
            return iana;
        }

        // The default (first) IANA mapping of this zone.
        Tz ToTz() const;

        bool operator==(const WindowsTz& other) const = default;

        /// <summary>
        /// Returns the zone <b>only if it is registered in the bundled dataset</b>, or <c>nullptr</c>.
        /// If no <c>territory</c> is given, the first record with a matching <c>zone</c> is returned.
        /// </summary>
        static const WindowsTz* Get(std::string_view zone,
            std::optional<std::string_view> territory = std::nullopt);

        /// <summary>
        /// Returns the first record listing <c>tz</c> among its IANA identifiers.
        /// Throws <see cref="UnknownTimezoneException"/> if there is none.
        /// </summary>
        static const WindowsTz& FromIana(const Tz& tz);

        static const std::vector<WindowsTz>& GetAll();

        static std::optional<std::chrono::sys_seconds> BuildDate();
        static std::optional<uint64_t> Hash();
        static std::pair<std::string_view, std::string_view> Version();
    };

    namespace Detail
    {
        // Defined by the source file generated by systz_zonegen.
        const std::vector<WindowsTz>& GetWindowsZones();
        const WindowsZonesVersion& GetWindowsZonesVersion();
    }
}

#endif // __LIBSYSTZ_WINDOWSTZ_H__
