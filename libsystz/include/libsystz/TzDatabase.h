#ifndef __LIBSYSTZ_TZDATABASE_H__
#define __LIBSYSTZ_TZDATABASE_H__

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace LibSysTz
{
    /// <summary>
    /// The set of time zone identifiers known to the ICU time zone database, including backward-compatible
    /// links such as <c>US/Pacific</c>.  The set is loaded once, on first use, and never changes afterwards.
    /// </summary>
    class TzDatabase
    {
    private:
        std::unordered_set<std::string> names;

        // Lower-cased identifier -> identifier as spelled by the database.
        std::unordered_map<std::string, std::string> foldedNames;

        TzDatabase();
    public:
        TzDatabase(const TzDatabase&) = delete;
        TzDatabase& operator=(const TzDatabase&) = delete;

        bool Contains(std::string_view name) const;

        std::optional<std::string> FindInsensitive(std::string_view name) const;

        size_t GetCount() const
        {
            return names.size();
        }

        // Throws TzException if ICU cannot enumerate its time zones.
        static const TzDatabase& GetInstance();
    };
}

#endif // __LIBSYSTZ_TZDATABASE_H__
