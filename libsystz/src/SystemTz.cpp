#include <cstring>

#include <libsystz/SystemTz.h>

namespace LibSysTz
{
    bool SystemTzDebugEnabled(const char* value)
    {
        return value != NULL && value[0] != '\0' && strcmp(value, "0") != 0;
    }
}
