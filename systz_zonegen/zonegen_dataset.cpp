#include <cctype>
#include <sstream>

#include <libsystz/TzException.h>

#include "zonegen_dataset.h"
#include "zonegen_errors.h"
#include "zonegen_hash.h"
#include "zonegen_xmlreader.h"

static std::vector<std::string> zonegen_split_types(const std::string& types)
{
    std::vector<std::string> result;
    std::istringstream stream(types);
    std::string name;
    while (stream >> name)
    {
        result.push_back(name);
    }
    return result;
}

static std::string zonegen_describe(const XmlReader& reader)
{
    return "<" + reader.NodeName() + "> at line " + std::to_string(reader.GetLineNumber());
}

static std::string zonegen_require_attribute(const XmlReader& reader, const char* name)
{
    auto value = reader.NodeAttribute(name);
    if (!value.has_value())
    {
        throw ZoneGenException(ZoneGenStage::Parse,
            zonegen_describe(reader) + " has no '" + name + "' attribute");
    }
    return value.value();
}

static MapZone zonegen_read_map_zone(const XmlReader& reader)
{
    MapZone zone;
    zone.zone = zonegen_require_attribute(reader, "other");
    zone.territory = reader.NodeAttribute("territory");

    std::string types = zonegen_require_attribute(reader, "type");
    std::vector<std::string> names = zonegen_split_types(types);

    std::string what = "mapZone \"" + zone.zone + "\""
        + (zone.territory.has_value() ? " (territory " + zone.territory.value() + ")" : "");

    if (names.empty())
    {
        throw ZoneGenException(ZoneGenStage::Validate, what + " lists no IANA time zone");
    }

    for (const auto& name : names)
    {
        std::optional<LibSysTz::Tz> tz;
        try
        {
            tz = LibSysTz::Tz::TryParse(name);
        }
        catch (const LibSysTz::TzException& e)
        {
            throw ZoneGenException(ZoneGenStage::Validate, "unable to validate " + what, e);
        }

        if (!tz.has_value())
        {
            throw ZoneGenException(ZoneGenStage::Validate,
                what + " maps to unknown IANA time zone \"" + name + "\"");
        }
        zone.iana.push_back(tz.value());
    }

    return zone;
}

WindowsZonesData WindowsZonesData::Parse(const std::string& document)
{
    WindowsZonesData data;

    XmlReader reader;
    if (!reader.Load(document))
    {
        throw ZoneGenException(ZoneGenStage::Parse, reader.GetError());
    }

    bool sawRoot = false;
    bool sawMapTimezones = false;
    // Name of the current child of the root element.
    std::string section;

    while (reader.Read())
    {
        if (!reader.IsStartElement())
        {
            continue;
        }

        int depth = reader.Depth();
        std::string name = reader.NodeName();

        if (depth == 0)
        {
            if (name != "supplementalData")
            {
                throw ZoneGenException(ZoneGenStage::Parse,
                    "expected <supplementalData> as the root element, found <" + name + ">");
            }
            sawRoot = true;
            continue;
        }

        if (depth == 1)
        {
            section = name;
            continue;
        }

        // Only <windowsZones> is of interest; <version> and friends are skipped.
        if (section != "windowsZones")
        {
            continue;
        }

        if (depth == 2)
        {
            if (name != "mapTimezones")
            {
                throw ZoneGenException(ZoneGenStage::Parse,
                    "unexpected " + zonegen_describe(reader) + " in <windowsZones>");
            }
            if (sawMapTimezones)
            {
                throw ZoneGenException(ZoneGenStage::Parse,
                    "more than one <mapTimezones> in <windowsZones>");
            }
            data._otherVersion = zonegen_require_attribute(reader, "otherVersion");
            data._typeVersion = zonegen_require_attribute(reader, "typeVersion");
            sawMapTimezones = true;
        }
        else if (depth == 3 && name == "mapZone")
        {
            data._zones.push_back(zonegen_read_map_zone(reader));
        }
        else
        {
            throw ZoneGenException(ZoneGenStage::Parse,
                "unexpected " + zonegen_describe(reader) + " in <windowsZones>");
        }
    }

    if (reader.HasError())
    {
        throw ZoneGenException(ZoneGenStage::Parse, "malformed XML document: " + reader.GetError());
    }

    if (!sawRoot)
    {
        throw ZoneGenException(ZoneGenStage::Parse, "the document is empty");
    }

    if (!sawMapTimezones)
    {
        throw ZoneGenException(ZoneGenStage::Parse, "the document has no <windowsZones><mapTimezones> element");
    }

    return data;
}

void WindowsZonesData::AddSyntheticZones()
{
    try
    {
        _zones.push_back(MapZone { "Coordinated Universal Time", std::nullopt, { LibSysTz::Tz::Utc() } });
    }
    catch (const LibSysTz::TzException& e)
    {
        throw ZoneGenException(ZoneGenStage::Validate, "unable to add the synthetic UTC zone", e);
    }
}

uint64_t WindowsZonesData::Hash() const
{
    Fnv1a64 hash;

    hash.Update(_otherVersion);
    hash.Update(_typeVersion);
    hash.Update(static_cast<uint64_t>(_zones.size()));

    for (const auto& zone : _zones)
    {
        hash.Update(zone.zone);
        hash.Update(static_cast<uint64_t>(zone.territory.has_value()));
        if (zone.territory.has_value())
        {
            hash.Update(zone.territory.value());
        }
        hash.Update(static_cast<uint64_t>(zone.iana.size()));
        for (const auto& tz : zone.iana)
        {
            hash.Update(tz.GetName());
        }
    }

    return hash.Finish();
}
