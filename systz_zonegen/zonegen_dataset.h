#ifndef __ZONEGEN_DATASET_H__
#define __ZONEGEN_DATASET_H__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <libsystz/Tz.h>

// One <mapZone> of the CLDR windowsZones document.
struct MapZone
{
    std::string zone;
    std::optional<std::string> territory;
    std::vector<LibSysTz::Tz> iana;
};

class WindowsZonesData
{
private:
    std::string _otherVersion;
    std::string _typeVersion;
    std::vector<MapZone> _zones;

    WindowsZonesData() = default;
public:
    // Parses and validates a windowsZones.xml document. Every IANA name must
    // be known to the time zone database. Throws ZoneGenException.
    static WindowsZonesData Parse(const std::string& document);

    // Appends the zones Windows reports but the document does not reliably map.
    void AddSyntheticZones();

    const std::string& GetOtherVersion() const { return _otherVersion; }
    const std::string& GetTypeVersion() const { return _typeVersion; }
    const std::vector<MapZone>& GetZones() const { return _zones; }

    // Fingerprint of the versions and of every zone, in order.
    uint64_t Hash() const;
};

#endif // __ZONEGEN_DATASET_H__
