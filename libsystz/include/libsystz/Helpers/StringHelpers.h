#ifndef __LIBSYSTZ_STRINGHELPERS_H__
#define __LIBSYSTZ_STRINGHELPERS_H__

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace LibSysTz::Helpers
{
    std::string trim(std::string_view input);
    std::string trimStart(std::string_view input);
    std::string tolower(std::string_view input);

    bool startsWith(std::string_view input, std::string_view prefix);

    // Splits at the first occurrence of the separator.
    std::optional<std::pair<std::string_view, std::string_view>>
        splitOnce(std::string_view input, std::string_view separator);

    // Removes one pair of matching single or double quotes, if present.
    std::string unquote(std::string_view input);

    // Decodes a fixed-size UTF-16 buffer up to its first NUL (or its end).
    // Unpaired surrogates become U+FFFD.
    std::string fromUtf16(const char16_t* buffer, size_t capacity);
}

#endif // __LIBSYSTZ_STRINGHELPERS_H__
