#include <cstdlib>
#include <iostream>
#include <string>

#include <emscripten/val.h>

#include <libsystz/SystemTz.h>
#include <libsystz/TzException.h>

namespace LibSysTz
{
    // Reference: https://developer.mozilla.org/en-US/docs/Web/JavaScript/Reference/Global_Objects/DateTimeFormat
    std::optional<Tz> SystemTz()
    {
        using emscripten::val;

        try
        {
            val intl = val::global("Intl");
            if (intl.isUndefined())
            {
                return std::nullopt;
            }

            val options = intl["DateTimeFormat"].new_().call<val>("resolvedOptions");

            for (const char* field : { "timeZoneName", "timeZone" })
            {
                val value = options[field];
                if (!value.isString())
                {
                    continue;
                }

                auto tz = Tz::TryParseInsensitive(value.as<std::string>());
                if (tz.has_value())
                {
                    return tz;
                }
            }

            return std::nullopt;
        }
        catch (const TzException& e)
        {
            if (SystemTzDebugEnabled(getenv("SYSTZ_DEBUG")))
            {
                std::cerr << "systz: " << e.what() << std::endl;
            }
            return std::nullopt;
        }
    }
}
