#include <libsystz/Helpers/StringHelpers.h>
#include <libsystz/Tz.h>
#include <libsystz/TzDatabase.h>
#include <libsystz/TzException.h>

namespace LibSysTz
{
    std::optional<Tz> Tz::TryParse(std::string_view name)
    {
        if (!TzDatabase::GetInstance().Contains(name))
        {
            return std::nullopt;
        }
        return Tz(std::string(name));
    }

    Tz Tz::Parse(std::string_view name)
    {
        auto result = TryParse(name);
        return result.has_value() ? result.value() : throw TzException("'" + std::string(name) + "' is not a known IANA time zone");
    }

    std::optional<Tz> Tz::TryParseInsensitive(std::string_view name)
    {
        std::string trimmed = Helpers::trim(name);
        if (trimmed.empty())
        {
            return std::nullopt;
        }

        auto found = TzDatabase::GetInstance().FindInsensitive(trimmed);
        if (!found.has_value())
        {
            return std::nullopt;
        }
        return Tz(found.value());
    }

    Tz Tz::Utc()
    {
        return Parse("Etc/UTC");
    }

    std::ostream& operator<<(std::ostream& os, const Tz& tz)
    {
        return os << tz.GetName();
    }
}
