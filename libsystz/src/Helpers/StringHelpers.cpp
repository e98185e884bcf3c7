#include <algorithm>
#include <cctype>
#include <iterator>

#include <unicode/unistr.h>

#include <libsystz/Helpers/StringHelpers.h>

namespace LibSysTz::Helpers
{
    static bool isspace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c));
    }

    std::string trim(std::string_view input)
    {
        auto beg = input.begin();
        auto end = input.end();

        while (beg != end && isspace(*beg))
        {
            ++beg;
        }

        while (end > beg && isspace(*(end - 1)))
        {
            --end;
        }

        return std::string(beg, end);
    }

    std::string trimStart(std::string_view input)
    {
        auto beg = std::find_if_not(input.begin(), input.end(), [](char c) { return isspace(c); });
        return std::string(beg, input.end());
    }

    std::string tolower(std::string_view input)
    {
        std::string result;
        result.reserve(input.size());

        std::transform(input.begin(), input.end(), std::back_inserter(result),
            [](char c) { return std::tolower(static_cast<unsigned char>(c)); });

        return result;
    }

    bool startsWith(std::string_view input, std::string_view prefix)
    {
        return input.substr(0, prefix.size()) == prefix;
    }

    std::optional<std::pair<std::string_view, std::string_view>>
        splitOnce(std::string_view input, std::string_view separator)
    {
        size_t pos = input.find(separator);
        if (pos == std::string_view::npos)
        {
            return std::nullopt;
        }

        return std::make_pair(input.substr(0, pos), input.substr(pos + separator.size()));
    }

    std::string unquote(std::string_view input)
    {
        if (input.size() >= 2
            && (input.front() == '"' || input.front() == '\'')
            && input.back() == input.front())
        {
            return std::string(input.substr(1, input.size() - 2));
        }

        return std::string(input);
    }

    std::string fromUtf16(const char16_t* buffer, size_t capacity)
    {
        const char16_t* end = std::find(buffer, buffer + capacity, u'\0');

        std::string result;
        icu::UnicodeString(buffer, static_cast<int32_t>(end - buffer)).toUTF8String(result);
        return result;
    }
}
