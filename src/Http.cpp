#include "Extension/Http.hpp"

#include <cstdio>
#include <memory>

#include <curl/curl.h>

#ifndef BRIDGE_VERSION
#define BRIDGE_VERSION "0.0.0"
#endif

namespace Http
{
namespace
{
struct CurlGlobal
{
    CurlGlobal()
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~CurlGlobal()
    {
        curl_global_cleanup();
    }
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

CurlHandle makeHandle()
{
    static CurlGlobal global;
    return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
}

size_t writeToString(char* data, size_t size, size_t count, void* userdata)
{
    auto* output = static_cast<std::string*>(userdata);
    output->append(data, size * count);
    return size * count;
}

size_t writeToFile(char* data, size_t size, size_t count, void* userdata)
{
    return fwrite(data, size, count, static_cast<FILE*>(userdata)) * size;
}

void setCommonOptions(CURL* curl, const std::string& url)
{
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}
} // namespace

const char* userAgent()
{
    return "nextflow-ls-bridge/" BRIDGE_VERSION;
}

std::optional<std::string> get(const std::string& url, const std::vector<std::string>& headers, Response& response)
{
    auto curl = makeHandle();
    if (!curl)
        return "failed to initialize libcurl";

    CurlHeaders headerList(nullptr, &curl_slist_free_all);
    for (const auto& header : headers)
    {
        curl_slist* appended = curl_slist_append(headerList.get(), header.c_str());
        if (!appended)
            return "failed to build request headers";
        headerList.release();
        headerList.reset(appended);
    }

    response = Response{};
    setCommonOptions(curl.get(), url);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK)
        return std::string("request to ") + url + " failed: " + curl_easy_strerror(code);

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.statusCode);
    return std::nullopt;
}

std::optional<std::string> downloadToFile(const std::string& url, const std::string& path)
{
    auto curl = makeHandle();
    if (!curl)
        return "failed to initialize libcurl";

    FILE* file = fopen(path.c_str(), "wb");
    if (!file)
        return "failed to open '" + path + "' for writing";

    setCommonOptions(curl.get(), url);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file);

    CURLcode code = curl_easy_perform(curl.get());
    bool closed = fclose(file) == 0;

    if (code != CURLE_OK)
        return std::string("download of ") + url + " failed: " + curl_easy_strerror(code);
    if (!closed)
        return "failed to write '" + path + "'";

    return std::nullopt;
}
} // namespace Http
