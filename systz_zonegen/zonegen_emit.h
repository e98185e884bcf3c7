#ifndef __ZONEGEN_EMIT_H__
#define __ZONEGEN_EMIT_H__

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

class WindowsZonesData;

// Quotes and escapes a string as a C++ narrow string literal.
std::string zonegen_cpp_literal(std::string_view value);

// Formats as RFC 3339, e.g. "2023-04-18T09:12:44Z".
std::string zonegen_format_date(std::chrono::sys_seconds date);

// The build date to record: nothing if disabled, SOURCE_DATE_EPOCH if set,
// the current time otherwise.
std::optional<std::chrono::sys_seconds> zonegen_build_date(bool disabled, const char* sourceDateEpoch);

// Writes the C++ source defining the LibSysTz::Detail table and version.
void zonegen_write_source(std::ostream& out, const WindowsZonesData& data,
    const std::optional<std::chrono::sys_seconds>& buildDate, const std::string& source);

// Writes to a temporary file next to |path| and renames it into place, so a
// failed run never leaves a truncated dataset behind.
void zonegen_write_file(const std::filesystem::path& path, const WindowsZonesData& data,
    const std::optional<std::chrono::sys_seconds>& buildDate, const std::string& source);

#endif // __ZONEGEN_EMIT_H__
