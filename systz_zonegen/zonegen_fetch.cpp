#include <fstream>
#include <iterator>
#include <memory>

#include <curl/curl.h>

#include "zonegen_errors.h"
#include "zonegen_fetch.h"

namespace
{
    struct curl_deleter
    {
        void operator()(CURL* p) const
        {
            curl_easy_cleanup(p);
        }
    };
}

static int zonegen_curl_global()
{
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0)
    {
        throw ZoneGenException(ZoneGenStage::Fetch, "CURL global initialization failed");
    }
    return 0;
}

static std::unique_ptr<CURL, curl_deleter> zonegen_curl_init()
{
    static const int curlInitialized = zonegen_curl_global();
    (void)curlInitialized;
    return std::unique_ptr<CURL, curl_deleter>(curl_easy_init());
}

std::string zonegen_fetch(const std::string& url)
{
    auto curl = zonegen_curl_init();
    if (!curl)
    {
        throw ZoneGenException(ZoneGenStage::Fetch, "curl_easy_init() failed");
    }

    std::string body;
    char errorBuffer[CURL_ERROR_SIZE] = {};

    curl_write_callback writeCallback = [](char* contents, size_t size, size_t nmemb, void* userp) -> size_t
    {
        auto& result = *static_cast<std::string*>(userp);
        size_t realSize = size * nmemb;
        result.append(contents, realSize);
        return realSize;
    };

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "systz_zonegen");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
    {
        std::string reason = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        throw ZoneGenException(ZoneGenStage::Fetch, "failed to GET " + url + ": " + reason);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
    {
        throw ZoneGenException(ZoneGenStage::Fetch,
            "failed to GET " + url + ": HTTP status " + std::to_string(status));
    }

    return body;
}

std::string zonegen_read_file(const std::filesystem::path& path)
{
    std::ifstream fin(path, std::ios::in | std::ios::binary);
    if (!fin.is_open())
    {
        throw ZoneGenException(ZoneGenStage::Fetch, "failed to open " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
    if (fin.bad())
    {
        throw ZoneGenException(ZoneGenStage::Fetch, "failed to read " + path.string());
    }
    return content;
}
