#include <cstdlib>
#include <iostream>

#include <libsystz/SystemTz.h>

#ifndef SYSTZ_BUG_REPORT_URL
#define SYSTZ_BUG_REPORT_URL "https://github.com/b4D8/system_tz"
#endif

int main()
{
    auto tz = LibSysTz::SystemTz();
    if (tz.has_value())
    {
        std::cout << tz.value() << std::endl;
        return EXIT_SUCCESS;
    }

    std::cerr << "Error: Failed to get timezone" << std::endl;
    std::cerr << "You might want to report this error on " << SYSTZ_BUG_REPORT_URL << std::endl;
    return EXIT_FAILURE;
}
