#pragma once

#include <httplib.h>
#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Request parameters for ContentFetcher
 */
struct FetchOptions
{
    httplib::Headers headers;
    std::chrono::milliseconds timeout; // Applied to connect, read and write separately
    int max_redirects;                 // Redirects followed before giving up

    FetchOptions() : timeout(std::chrono::seconds(36)), max_redirects(5) {}

    // Browser headers, download timeout and redirect budget from PocoConfigManager
    static FetchOptions fromConfig();
};

/**
 * @brief Outcome of a fetch, including the URL the body was finally served from
 */
struct FetchResult
{
    bool success;
    std::string error_message;
    int status;
    std::string final_url;
    std::string body;
    int redirects_followed;

    FetchResult() : success(false), status(0), redirects_followed(0) {}
};

/**
 * @brief Decomposed absolute http(s) URL
 */
struct UrlParts
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // Path plus query, at least "/"

    UrlParts() : port(0) {}

    // scheme://host[:port], the form httplib::Client expects
    std::string origin() const;
};

/**
 * @brief HTTP GET with manual, bounded redirect handling
 *
 * Redirects are never followed by the HTTP client itself. Any response that
 * carries a Location header counts as a redirect regardless of its status,
 * since some image hosts answer 200 with a Location. The body is only
 * accepted from a 200 response without Location. There are no retries.
 */
class ContentFetcher
{
public:
    static FetchResult fetchFinalContent(const std::string &url, const FetchOptions &options);

    /**
     * @brief Prepend https:// to URLs without a scheme
     *
     * Leading slashes and surrounding whitespace are removed first, so
     * "//cdn.example/x.png" and "cdn.example/x.png" both become
     * "https://cdn.example/x.png".
     */
    static std::string normalizeUrl(const std::string &url);

    // Desktop-browser User-Agent and Accept headers
    static httplib::Headers buildBrowserHeaders();

    static std::optional<UrlParts> splitUrl(const std::string &url);

    /**
     * @brief Absolute URL for a Location value seen while fetching current_url
     *
     * "//host/x" takes the current scheme, "/x" the current origin, anything
     * without a scheme is treated as host/path under https.
     */
    static std::string resolveLocation(const std::string &current_url, const std::string &location);
};
