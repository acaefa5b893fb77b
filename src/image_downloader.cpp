#include "core/image_downloader.hpp"
#include "core/file_type_sniffer.hpp"
#include "core/file_utils.hpp"
#include "core/image_info_extractor.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string downloadErrorName(DownloadError error)
{
    switch (error)
    {
    case DownloadError::FETCH_FAILED:
        return "FetchFailed";
    case DownloadError::UNRECOGNIZED_CONTENT:
        return "UnrecognizedContent";
    case DownloadError::WRITE_FAILED:
        return "WriteFailed";
    default:
        return "None";
    }
}

DownloadResult DownloadResult::failure(DownloadError error, const std::string &message)
{
    DownloadResult result;
    result.error = error;
    result.error_message = message;
    return result;
}

ImageDownloader::ImageDownloader()
    : options_(FetchOptions::fromConfig())
{
}

ImageDownloader::ImageDownloader(FetchOptions options, RecordSink sink)
    : options_(std::move(options)), sink_(std::move(sink))
{
}

DownloadResult ImageDownloader::downloadTo(const std::string &url, const std::string &target_dir,
                                           const std::optional<std::string> &filename_override) const
{
    std::string normalized = ContentFetcher::normalizeUrl(url);
    FetchOptions request = options_;
    if (request.headers.empty())
    {
        request.headers = ContentFetcher::buildBrowserHeaders();
    }

    FetchResult fetched = ContentFetcher::fetchFinalContent(normalized, request);
    if (!fetched.success)
    {
        return DownloadResult::failure(DownloadError::FETCH_FAILED, fetched.error_message);
    }

    std::vector<uint8_t> content(fetched.body.begin(), fetched.body.end());
    return saveContent(content, target_dir, normalized, filename_override);
}

DownloadResult ImageDownloader::saveContent(const std::vector<uint8_t> &content, const std::string &target_dir,
                                            const std::string &origin_url,
                                            const std::optional<std::string> &filename_override) const
{
    size_t sniff_length = std::min(content.size(), FileTypeSniffer::kSniffLength);
    auto file_type = FileTypeSniffer::identifyType(content.data(), sniff_length);
    if (!file_type)
    {
        return DownloadResult::failure(DownloadError::UNRECOGNIZED_CONTENT,
                                       "Unrecognized content from " + origin_url + " (" + std::to_string(content.size()) + " bytes)");
    }

    return persist(content, ImageInfoExtractor::extractInfo(content), *file_type, target_dir, origin_url, filename_override);
}

DownloadResult ImageDownloader::saveDecodedContent(const std::vector<uint8_t> &content, const std::string &target_dir,
                                                   const std::string &origin_url) const
{
    ImageRecord record = ImageInfoExtractor::extractInfo(content);
    if (!record.isDecodedImage() || record.file_type.empty())
    {
        return DownloadResult::failure(DownloadError::UNRECOGNIZED_CONTENT,
                                       "Content from " + origin_url + " is neither a known format nor a decodable image");
    }
    std::string file_type = record.file_type;
    return persist(content, std::move(record), file_type, target_dir, origin_url, std::nullopt);
}

DownloadResult ImageDownloader::persist(const std::vector<uint8_t> &content, ImageRecord record, const std::string &file_type,
                                        const std::string &target_dir, const std::string &origin_url,
                                        const std::optional<std::string> &filename_override) const
{
    // Non-image and undecodable content keeps its sniffed type
    if (record.file_type.empty())
        record.file_type = file_type;
    std::string filename = filename_override && !filename_override->empty()
                               ? *filename_override
                               : record.content_hash + FileTypeSniffer::extensionFor(file_type);
    fs::path target = fs::path(target_dir) / filename;

    DownloadResult result;
    result.image.origin_url = origin_url;
    result.image.file_path = target.string();

    std::error_code ec;
    if (fs::exists(target, ec))
    {
        // Report what is on disk; with hash-derived names this equals the fetched content
        auto existing = FileUtils::readFileBytes(target.string());
        result.image.record = existing ? ImageInfoExtractor::extractInfo(*existing) : record;
        if (result.image.record.file_type.empty() && existing)
        {
            size_t existing_sniff = std::min(existing->size(), FileTypeSniffer::kSniffLength);
            result.image.record.file_type = FileTypeSniffer::identifyType(existing->data(), existing_sniff).value_or("");
        }
        result.image.already_existed = true;
        result.success = true;
        Logger::debug("Already present, not rewriting: " + target.string());
        if (sink_)
            sink_(result.image);
        return result;
    }

    fs::create_directories(target_dir, ec);
    if (ec)
    {
        return DownloadResult::failure(DownloadError::WRITE_FAILED,
                                       "Cannot create directory " + target_dir + ": " + ec.message());
    }

    std::string write_error;
    if (!FileUtils::writeFileAtomically(target.string(), content, &write_error))
    {
        return DownloadResult::failure(DownloadError::WRITE_FAILED, write_error);
    }

    result.image.record = record;
    result.success = true;
    Logger::info("Saved " + origin_url + " -> " + target.string() + " (" + std::to_string(record.size_bytes) + " bytes" +
                 (record.isDecodedImage() ? ", " + std::to_string(record.width) + "x" + std::to_string(record.height) : "") + ")");
    if (sink_)
        sink_(result.image);
    return result;
}

ProbeResult ImageDownloader::probeRemoteImage(const std::string &url) const
{
    ProbeResult probe;
    FetchOptions request = options_;
    if (request.headers.empty())
    {
        request.headers = ContentFetcher::buildBrowserHeaders();
    }

    FetchResult fetched = ContentFetcher::fetchFinalContent(ContentFetcher::normalizeUrl(url), request);
    probe.final_url = fetched.final_url;
    if (!fetched.success)
    {
        probe.error_message = fetched.error_message;
        return probe;
    }

    std::vector<uint8_t> content(fetched.body.begin(), fetched.body.end());
    probe.record = ImageInfoExtractor::extractInfo(content);
    if (!probe.record.isDecodedImage())
    {
        probe.error_message = "Content at " + fetched.final_url + " is not a decodable image";
        return probe;
    }
    probe.success = true;
    return probe;
}

bool ImageDownloader::isAccessible(const std::string &url) const
{
    return ContentFetcher::fetchFinalContent(ContentFetcher::normalizeUrl(url), options_).success;
}
