#ifndef __ZONEGEN_FETCH_H__
#define __ZONEGEN_FETCH_H__

#include <filesystem>
#include <string>

#define ZONEGEN_DEFAULT_SOURCE_URL \
    "https://raw.githubusercontent.com/unicode-org/cldr/main/common/supplemental/windowsZones.xml"

// Downloads the whole document. Throws ZoneGenException on network errors
// and on any HTTP status outside 2xx.
std::string zonegen_fetch(const std::string& url);

// Reads a local copy of the document instead of downloading it.
std::string zonegen_read_file(const std::filesystem::path& path);

#endif // __ZONEGEN_FETCH_H__
