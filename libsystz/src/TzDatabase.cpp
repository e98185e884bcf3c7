#include <algorithm>
#include <iterator>
#include <memory>
#include <string_view>

#include <unicode/strenum.h>
#include <unicode/timezone.h>
#include <unicode/utypes.h>

#include <libsystz/Helpers/StringHelpers.h>
#include <libsystz/TzDatabase.h>
#include <libsystz/TzException.h>

namespace LibSysTz
{
    // ICU also enumerates IDs that are not part of the IANA database: the
    // three-letter aliases inherited from Java, and the SystemV/ zones.
    // ICU 74 can tell them apart with TimeZone::getIanaID(); older releases cannot.
    static constexpr std::string_view nonIanaIds[] =
    {
        "ACT", "AET", "AGT", "ART", "AST", "BET", "BST", "CAT", "CNT", "CST", "CTT", "EAT", "ECT",
        "IET", "IST", "JST", "MIT", "NET", "NST", "PLT", "PNT", "PRT", "PST", "SST", "VST"
    };

    static bool isIanaId(std::string_view id)
    {
        if (Helpers::startsWith(id, "SystemV/"))
        {
            return false;
        }
        return std::find(std::begin(nonIanaIds), std::end(nonIanaIds), id) == std::end(nonIanaIds);
    }

    TzDatabase::TzDatabase()
    {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::StringEnumeration> ids(
            icu::TimeZone::createTimeZoneIDEnumeration(UCAL_ZONE_TYPE_ANY, nullptr, nullptr, status));

        if (U_FAILURE(status) || !ids)
        {
            throw TzException(std::string("unable to enumerate the ICU time zone database: ") + u_errorName(status));
        }

        int32_t length = 0;
        const char* id;
        while ((id = ids->next(&length, status)) != nullptr)
        {
            std::string name(id, length);
            if (!isIanaId(name))
            {
                continue;
            }
            foldedNames.emplace(Helpers::tolower(name), name);
            names.insert(std::move(name));
        }

        if (U_FAILURE(status))
        {
            throw TzException(std::string("unable to read the ICU time zone database: ") + u_errorName(status));
        }
    }

    bool TzDatabase::Contains(std::string_view name) const
    {
        return names.find(std::string(name)) != names.end();
    }

    std::optional<std::string> TzDatabase::FindInsensitive(std::string_view name) const
    {
        auto it = foldedNames.find(Helpers::tolower(name));
        if (it == foldedNames.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    const TzDatabase& TzDatabase::GetInstance()
    {
        static const TzDatabase instance;
        return instance;
    }
}
