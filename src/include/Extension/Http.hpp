#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Http
{
struct Response
{
    /// HTTP status code. Zero for protocols without status codes, such as file://
    long statusCode = 0;
    std::string body;
};

/// Performs a blocking GET request. Returns an error description if the transfer itself failed;
/// HTTP error statuses are reported through `response.statusCode`
std::optional<std::string> get(const std::string& url, const std::vector<std::string>& headers, Response& response);

/// Streams the body of `url` into the file at `path`, following redirects.
/// Returns an error description on failure, including HTTP error statuses
std::optional<std::string> downloadToFile(const std::string& url, const std::string& path);

/// Value sent as the User-Agent header on every request
const char* userAgent();
} // namespace Http
