#include <cstdlib>
#include <iostream>

#include <libsystz/SystemTz.h>
#include <libsystz/TzException.h>
#include <libsystz/UnixTzResolver.h>

namespace LibSysTz
{
    std::optional<Tz> SystemTz()
    {
        try
        {
            return UnixTzResolver().Resolve();
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
