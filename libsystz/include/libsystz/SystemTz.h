#ifndef __LIBSYSTZ_SYSTEMTZ_H__
#define __LIBSYSTZ_SYSTEMTZ_H__

#include <optional>

#include "Tz.h"

namespace LibSysTz
{
    // Tries to get the time zone configured on the operating system.
    // The strategy is fixed at build time by the target platform family (unix, windows or wasm).
    // Returns std::nullopt if no source yields a known IANA identifier.
    std::optional<Tz> SystemTz();

    // True when SYSTZ_DEBUG is set to anything but "" or "0".
    bool SystemTzDebugEnabled(const char* value);
}

#endif // __LIBSYSTZ_SYSTEMTZ_H__
