#include "core/batch_acquirer.hpp"
#include "core/file_type_sniffer.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;

namespace
{
    constexpr size_t kSnippetLength = 200;

    std::string snippet(const std::string &body)
    {
        return body.substr(0, std::min(body.size(), kSnippetLength));
    }

    std::optional<std::string> referenceText(const nlohmann::json &value)
    {
        if (value.is_null())
            return std::nullopt;
        std::string text = value.is_string() ? value.get<std::string>() : value.dump();
        if (text.empty())
            return std::nullopt;
        return text;
    }
}

std::string acquisitionKindName(AcquisitionKind kind)
{
    switch (kind)
    {
    case AcquisitionKind::JSON:
        return "json";
    case AcquisitionKind::DIRECT:
        return "direct";
    default:
        return "failed";
    }
}

BatchAcquirer::BatchAcquirer()
    : source_options_(FetchOptions::fromConfig()), downloader_(),
      rounds_per_source_(PocoConfigManager::getInstance().getRoundsPerSource())
{
    source_options_.timeout = std::chrono::seconds(PocoConfigManager::getInstance().getBatchTimeoutSeconds());
}

BatchAcquirer::BatchAcquirer(FetchOptions source_options, ImageDownloader downloader)
    : source_options_(std::move(source_options)), downloader_(std::move(downloader)),
      rounds_per_source_(PocoConfigManager::getInstance().getRoundsPerSource())
{
}

std::vector<std::string> BatchAcquirer::cleanSources(const std::vector<std::string> &source_urls)
{
    std::vector<std::string> cleaned;
    std::unordered_set<std::string> seen;
    for (const auto &url : source_urls)
    {
        auto begin = std::find_if_not(url.begin(), url.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(url.rbegin(), url.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        if (begin >= end)
            continue;
        std::string trimmed(begin, end);
        if (seen.insert(trimmed).second)
            cleaned.push_back(trimmed);
    }
    return cleaned;
}

std::optional<std::string> BatchAcquirer::defaultReferenceParser(const nlohmann::json &document)
{
    if (!document.is_object())
    {
        return std::nullopt;
    }

    for (const char *key : {"url", "img", "text"})
    {
        auto it = document.find(key);
        if (it != document.end())
        {
            return referenceText(*it);
        }
    }

    auto data = document.find("data");
    if (data != document.end() && data->is_array() && !data->empty() && data->front().is_object())
    {
        const auto &item = data->front();
        auto url = item.find("url");
        if (url != item.end())
        {
            return referenceText(*url);
        }
        auto urls = item.find("urls");
        if (urls != item.end() && urls->is_object() && urls->contains("original"))
        {
            return referenceText(urls->at("original"));
        }
    }
    return std::nullopt;
}

std::string BatchAcquirer::absolutizeReference(const std::string &source_url, const std::string &reference)
{
    if (reference.rfind("http://", 0) == 0 || reference.rfind("https://", 0) == 0)
    {
        return reference;
    }
    std::string scheme = source_url.rfind("https", 0) == 0 ? "https://" : "http://";
    size_t first = reference.find_first_not_of('/');
    return scheme + (first == std::string::npos ? std::string() : reference.substr(first));
}

BatchSummary BatchAcquirer::acquireFromSources(const std::vector<std::string> &source_urls, const std::string &target_dir) const
{
    return acquireFromSources(source_urls, target_dir, rounds_per_source_);
}

BatchSummary BatchAcquirer::acquireFromSources(const std::vector<std::string> &source_urls, const std::string &target_dir,
                                               int rounds_per_source, ReferenceParser parser) const
{
    BatchSummary summary;
    std::vector<std::string> sources = cleanSources(source_urls);
    if (sources.empty() || rounds_per_source <= 0)
    {
        Logger::warn("No sources to acquire from");
        return summary;
    }

    const ReferenceParser &active_parser = parser ? parser : ReferenceParser(defaultReferenceParser);
    Logger::info("Acquiring from " + std::to_string(sources.size()) + " sources, " + std::to_string(rounds_per_source) + " rounds each");

    for (int round = 1; round <= rounds_per_source; ++round)
    {
        for (const auto &source : sources)
        {
            AcquisitionDetail detail = acquireOnce(source, round, target_dir, active_parser);
            if (detail.kind == AcquisitionKind::FAILED)
            {
                summary.failure_count++;
                Logger::warn("Round " + std::to_string(round) + " " + source + ": " + detail.error);
            }
            else
            {
                summary.success_count++;
                Logger::info("Round " + std::to_string(round) + " " + source + ": " + acquisitionKindName(detail.kind) + " -> " + detail.file_path);
            }
            summary.details.push_back(std::move(detail));
        }
    }

    Logger::info("Batch finished: " + std::to_string(summary.success_count) + " succeeded, " + std::to_string(summary.failure_count) + " failed");
    return summary;
}

AcquisitionDetail BatchAcquirer::acquireOnce(const std::string &source, int round, const std::string &target_dir,
                                             const ReferenceParser &parser) const
{
    AcquisitionDetail detail;
    detail.source = source;
    detail.round = round;

    FetchResult fetched = ContentFetcher::fetchFinalContent(source, source_options_);
    if (!fetched.success)
    {
        detail.error = fetched.error_message;
        return detail;
    }

    nlohmann::json document = nlohmann::json::parse(fetched.body, nullptr, false);
    if (!document.is_discarded())
    {
        std::optional<std::string> reference;
        try
        {
            reference = parser(document);
        }
        catch (const nlohmann::json::exception &e)
        {
            detail.error = "Reference parser failed for " + source + ": " + e.what();
            return detail;
        }
        catch (const std::exception &e)
        {
            detail.error = "Reference parser error for " + source + ": " + e.what();
            return detail;
        }

        if (!reference)
        {
            detail.error = "No image reference in JSON from " + source + ": " + snippet(fetched.body);
            return detail;
        }

        detail.reference = absolutizeReference(source, *reference);
        DownloadResult download = downloader_.downloadTo(detail.reference, target_dir);
        if (!download.success)
        {
            detail.error = downloadErrorName(download.error) + ": " + download.error_message;
            return detail;
        }
        detail.kind = AcquisitionKind::JSON;
        detail.file_path = download.image.file_path;
        return detail;
    }

    std::vector<uint8_t> content(fetched.body.begin(), fetched.body.end());
    size_t sniff_length = std::min(content.size(), FileTypeSniffer::kSniffLength);
    auto file_type = FileTypeSniffer::identifyType(content.data(), sniff_length);
    if (file_type && *file_type == "html")
    {
        detail.error = "HTML error page from " + source + ": " + snippet(fetched.body);
        return detail;
    }
    if (!file_type || !FileTypeSniffer::isRasterImageType(*file_type))
    {
        // Last resort for formats without a signature entry (PNM, Radiance)
        DownloadResult decoded = downloader_.saveDecodedContent(content, target_dir, source);
        if (!decoded.success)
        {
            detail.error = (decoded.error == DownloadError::UNRECOGNIZED_CONTENT ? "Unrecognized response from " + source + ": " + snippet(fetched.body)
                                                                                 : downloadErrorName(decoded.error) + ": " + decoded.error_message);
            return detail;
        }
        detail.kind = AcquisitionKind::DIRECT;
        detail.reference = source;
        detail.file_path = decoded.image.file_path;
        return detail;
    }

    detail.reference = source;
    DownloadResult saved = downloader_.saveContent(content, target_dir, source);
    if (!saved.success)
    {
        detail.error = downloadErrorName(saved.error) + ": " + saved.error_message;
        return detail;
    }

    if (!saved.image.record.isDecodedImage())
    {
        if (!saved.image.already_existed)
        {
            std::error_code ec;
            fs::remove(saved.image.file_path, ec);
            if (ec)
                Logger::warn("Could not remove undecodable file " + saved.image.file_path + ": " + ec.message());
        }
        detail.error = "Direct response from " + source + " is not a decodable image";
        return detail;
    }

    detail.kind = AcquisitionKind::DIRECT;
    detail.file_path = saved.image.file_path;
    return detail;
}
