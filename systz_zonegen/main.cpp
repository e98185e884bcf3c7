#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

#include "zonegen_dataset.h"
#include "zonegen_emit.h"
#include "zonegen_errors.h"
#include "zonegen_fetch.h"

static void zonegen_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " --output <file> [--url <url> | --input <file>] [--no-timestamp]" << std::endl;
}

int main(int argc, char** argv)
{
    std::string url = ZONEGEN_DEFAULT_SOURCE_URL;
    std::filesystem::path input;
    std::filesystem::path output;
    bool noTimestamp = false;

    for (int i = 1; i < argc; ++i)
    {
        bool hasValue = i + 1 < argc;
        if (strcmp(argv[i], "--output") == 0 && hasValue)
        {
            output = argv[++i];
        }
        else if (strcmp(argv[i], "--url") == 0 && hasValue)
        {
            url = argv[++i];
        }
        else if (strcmp(argv[i], "--input") == 0 && hasValue)
        {
            input = argv[++i];
        }
        else if (strcmp(argv[i], "--no-timestamp") == 0)
        {
            noTimestamp = true;
        }
        else
        {
            std::cerr << "systz_zonegen: unexpected argument " << argv[i] << std::endl;
            zonegen_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (output.empty())
    {
        zonegen_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::string source;
        std::string document;

        if (!input.empty())
        {
            source = input.filename().string();
            std::cerr << "Reading CLDR windowsZones from " << input << "..." << std::endl;
            document = zonegen_read_file(input);
        }
        else
        {
            source = url;
            std::cerr << "Downloading CLDR windowsZones from " << url << "..." << std::endl;
            document = zonegen_fetch(url);
        }

        WindowsZonesData data = WindowsZonesData::Parse(document);
        data.AddSyntheticZones();

        auto buildDate = zonegen_build_date(noTimestamp, getenv("SOURCE_DATE_EPOCH"));

        zonegen_write_file(output, data, buildDate, source);

        std::cerr << "Wrote " << data.GetZones().size() << " zones (otherVersion " << data.GetOtherVersion()
            << ", typeVersion " << data.GetTypeVersion() << ", hash 0x"
            << std::hex << std::setw(16) << std::setfill('0') << data.Hash() << std::dec
            << ") to " << output << std::endl;
    }
    catch (const ZoneGenException& e)
    {
        std::cerr << "systz_zonegen: " << e.what() << std::endl;
        std::cerr << "systz_zonegen: the windowsZones dataset was not built." << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
