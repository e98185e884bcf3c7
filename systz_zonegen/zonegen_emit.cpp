#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "zonegen_dataset.h"
#include "zonegen_emit.h"
#include "zonegen_errors.h"

std::string zonegen_cpp_literal(std::string_view value)
{
    std::ostringstream out;
    out << '"';
    for (char c : value)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        switch (c)
        {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (uc < 0x20 || uc == 0x7f || uc >= 0x80)
                {
                    // Octal escapes stop after three digits, unlike \x.
                    out << '\\' << std::oct << std::setw(3) << std::setfill('0') << static_cast<int>(uc) << std::dec;
                }
                else
                {
                    out << c;
                }
                break;
        }
    }
    out << '"';
    return out.str();
}

std::string zonegen_format_date(std::chrono::sys_seconds date)
{
    std::time_t time = static_cast<std::time_t>(date.time_since_epoch().count());
    const std::tm* utc = std::gmtime(&time);
    if (utc == NULL)
    {
        return std::to_string(date.time_since_epoch().count());
    }

    std::ostringstream out;
    out << std::put_time(utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::optional<std::chrono::sys_seconds> zonegen_build_date(bool disabled, const char* sourceDateEpoch)
{
    if (disabled)
    {
        return std::nullopt;
    }

    // Reference: https://reproducible-builds.org/specs/source-date-epoch/
    if (sourceDateEpoch != NULL)
    {
        char* end = NULL;
        errno = 0;
        long long seconds = strtoll(sourceDateEpoch, &end, 10);
        if (errno != 0 || end == sourceDateEpoch || *end != '\0' || seconds < 0)
        {
            std::cerr << "systz_zonegen: ignoring invalid SOURCE_DATE_EPOCH \"" << sourceDateEpoch
                << "\"; the build date will not be recorded." << std::endl;
            return std::nullopt;
        }
        return std::chrono::sys_seconds(std::chrono::seconds(seconds));
    }

    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

void zonegen_write_source(std::ostream& out, const WindowsZonesData& data,
    const std::optional<std::chrono::sys_seconds>& buildDate, const std::string& source)
{
    uint64_t hash = data.Hash();

    out << "// Generated by systz_zonegen from " << source << "\n";
    out << "// Do not edit; rebuild to refresh the dataset.\n";
    out << "\n";
    out << "#include <libsystz/WindowsTz.h>\n";
    out << "\n";
    out << "namespace LibSysTz::Detail\n";
    out << "{\n";

    out << "    // Version of the bundled CLDR windowsZones dataset\n";
    out << "    const WindowsZonesVersion& GetWindowsZonesVersion()\n";
    out << "    {\n";
    out << "        static const WindowsZonesVersion version\n";
    out << "        {\n";
    if (buildDate.has_value())
    {
        out << "            std::chrono::sys_seconds(std::chrono::seconds("
            << buildDate->time_since_epoch().count() << ")), // "
            << zonegen_format_date(buildDate.value()) << "\n";
    }
    else
    {
        out << "            std::nullopt,\n";
    }
    out << "            { " << zonegen_cpp_literal(data.GetOtherVersion())
        << ", " << zonegen_cpp_literal(data.GetTypeVersion()) << " },\n";
    out << "            UINT64_C(0x" << std::hex << std::setw(16) << std::setfill('0') << hash
        << std::dec << std::setfill(' ') << ")\n";
    out << "        };\n";
    out << "        return version;\n";
    out << "    }\n";
    out << "\n";

    out << "    // Simplified representation of CLDR windowsZones data\n";
    out << "    const std::vector<WindowsTz>& GetWindowsZones()\n";
    out << "    {\n";
    out << "        static const std::vector<WindowsTz> zones\n";
    out << "        {\n";
    for (const auto& zone : data.GetZones())
    {
        out << "            WindowsTz(" << zonegen_cpp_literal(zone.zone) << ", ";
        if (zone.territory.has_value())
        {
            out << zonegen_cpp_literal(zone.territory.value());
        }
        else
        {
            out << "std::nullopt";
        }
        out << ", {";
        bool first = true;
        for (const auto& tz : zone.iana)
        {
            out << (first ? " " : ", ") << zonegen_cpp_literal(tz.GetName());
            first = false;
        }
        out << " }),\n";
    }
    out << "        };\n";
    out << "        return zones;\n";
    out << "    }\n";
    out << "}\n";
}

void zonegen_write_file(const std::filesystem::path& path, const WindowsZonesData& data,
    const std::optional<std::chrono::sys_seconds>& buildDate, const std::string& source)
{
    std::filesystem::path temporary = path;
    temporary += ".tmp";

    {
        std::ofstream fout(temporary, std::ios::out | std::ios::trunc);
        if (!fout.is_open())
        {
            throw ZoneGenException(ZoneGenStage::Emit, "failed to create " + temporary.string());
        }

        zonegen_write_source(fout, data, buildDate, source);

        fout.flush();
        if (!fout)
        {
            throw ZoneGenException(ZoneGenStage::Emit, "failed to write " + temporary.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec)
    {
        std::string reason = ec.message();
        std::filesystem::remove(temporary, ec);
        throw ZoneGenException(ZoneGenStage::Emit, "failed to move the dataset to " + path.string() + ": " + reason);
    }
}
