#ifndef __LIBSYSTZ_TZ_H__
#define __LIBSYSTZ_TZ_H__

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace LibSysTz
{
    /// <summary>
    /// <para>A time zone identifier from the IANA Time Zone Database (an Olson name such as
    /// <c>Europe/Paris</c>).</para>
    /// <para>Instances are only created by parsing against <see cref="TzDatabase"/>, so a <c>Tz</c> always
    /// names a zone the database knows about, spelled the way the database spells it.</para>
    /// </summary>
    class Tz
    {
    private:
        std::string name;

        explicit Tz(const std::string& name)
            : name(name)
        {
        }
    public:
        // Exact, case-sensitive match.
        static std::optional<Tz> TryParse(std::string_view name);

        // Same as TryParse(), but throws TzException when the name is not known.
        static Tz Parse(std::string_view name);

        // Trims surrounding whitespace and matches case-insensitively.
        static std::optional<Tz> TryParseInsensitive(std::string_view name);

        static Tz Utc();

        const std::string& GetName() const
        {
            return name;
        }

        bool operator==(const Tz& other) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const Tz& tz);
}

#endif // __LIBSYSTZ_TZ_H__
