#include "core/content_fetcher.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    // Scheme of an absolute URL, empty when the URL has none
    std::string schemeOf(const std::string &url)
    {
        auto pos = url.find("://");
        if (pos == std::string::npos || pos == 0)
            return "";
        for (size_t i = 0; i < pos; ++i)
        {
            unsigned char c = static_cast<unsigned char>(url[i]);
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
                return "";
        }
        return toLower(url.substr(0, pos));
    }
}

FetchOptions FetchOptions::fromConfig()
{
    auto &config = PocoConfigManager::getInstance();
    FetchOptions options;
    options.headers = ContentFetcher::buildBrowserHeaders();
    options.timeout = std::chrono::seconds(config.getDownloadTimeoutSeconds());
    options.max_redirects = config.getMaxRedirects();
    return options;
}

std::string UrlParts::origin() const
{
    bool default_port = (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    return scheme + "://" + host + (default_port ? "" : ":" + std::to_string(port));
}

std::string ContentFetcher::normalizeUrl(const std::string &url)
{
    std::string trimmed = trim(url);
    if (!schemeOf(trimmed).empty())
    {
        return trimmed;
    }
    size_t first = trimmed.find_first_not_of('/');
    return "https://" + (first == std::string::npos ? std::string() : trimmed.substr(first));
}

httplib::Headers ContentFetcher::buildBrowserHeaders()
{
    return {
        {"User-Agent", PocoConfigManager::getInstance().getUserAgent()},
        {"Accept", "image/avif,image/webp,image/apng,image/*,application/json;q=0.9,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Cache-Control", "no-cache"}};
}

std::optional<UrlParts> ContentFetcher::splitUrl(const std::string &url)
{
    std::string scheme = schemeOf(url);
    if (scheme != "http" && scheme != "https")
    {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = scheme;

    std::string rest = url.substr(url.find("://") + 3);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos)
        rest.erase(fragment);

    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    parts.path = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (parts.path[0] == '?')
        parts.path = "/" + parts.path;

    // Drop userinfo, it is never sent
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority.erase(0, at + 1);

    // A bracketed IPv6 literal keeps its colons; only a colon after ']' starts the port
    bool bracketed = !authority.empty() && authority[0] == '[';
    auto bracket = authority.rfind(']');
    if (bracketed != (bracket != std::string::npos))
    {
        return std::nullopt;
    }
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && (!bracketed || colon > bracket))
    {
        std::string port_text = authority.substr(colon + 1);
        authority.erase(colon);
        if (port_text.empty() || !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c)
                                              { return std::isdigit(c); }) ||
            port_text.size() > 5)
        {
            return std::nullopt;
        }
        parts.port = std::stoi(port_text);
    }
    else
    {
        parts.port = scheme == "https" ? 443 : 80;
    }

    if (authority.empty() || parts.port <= 0 || parts.port > 65535)
    {
        return std::nullopt;
    }
    parts.host = authority;
    return parts;
}

std::string ContentFetcher::resolveLocation(const std::string &current_url, const std::string &location)
{
    std::string target = trim(location);
    if (!schemeOf(target).empty())
    {
        return target;
    }

    auto current = splitUrl(current_url);
    if (target.rfind("//", 0) == 0)
    {
        return (current ? current->scheme : std::string("https")) + ":" + target;
    }
    if (!target.empty() && target[0] == '/' && current)
    {
        return current->origin() + target;
    }
    return normalizeUrl(target);
}

FetchResult ContentFetcher::fetchFinalContent(const std::string &url, const FetchOptions &options)
{
    FetchResult result;
    std::string current = normalizeUrl(url);

    while (true)
    {
        result.final_url = current;
        auto parts = splitUrl(current);
        if (!parts)
        {
            result.error_message = "Unsupported URL: " + current;
            Logger::warn(result.error_message);
            return result;
        }

        httplib::Client client(parts->origin());
        client.set_follow_location(false);
        client.set_connection_timeout(options.timeout);
        client.set_read_timeout(options.timeout);
        client.set_write_timeout(options.timeout);

        Logger::debug("GET " + current);
        auto response = client.Get(parts->path, options.headers);
        if (!response)
        {
            result.error_message = "Request to " + current + " failed: " + httplib::to_string(response.error());
            Logger::warn(result.error_message);
            return result;
        }

        result.status = response->status;
        if (response->has_header("Location"))
        {
            std::string location = response->get_header_value("Location");
            if (result.redirects_followed >= options.max_redirects)
            {
                result.error_message = "Too many redirects (limit " + std::to_string(options.max_redirects) + ") fetching " + url;
                Logger::warn(result.error_message);
                return result;
            }
            std::string next = resolveLocation(current, location);
            Logger::debug("Redirect " + std::to_string(response->status) + " from " + current + " to " + next);
            current = next;
            result.redirects_followed++;
            continue;
        }

        if (response->status != 200)
        {
            result.error_message = "HTTP " + std::to_string(response->status) + " from " + current;
            Logger::warn(result.error_message);
            return result;
        }

        result.body = std::move(response->body);
        result.success = true;
        return result;
    }
}
