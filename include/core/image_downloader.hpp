#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/content_fetcher.hpp"
#include "core/image_record.hpp"

enum class DownloadError
{
    NONE,
    FETCH_FAILED,
    UNRECOGNIZED_CONTENT,
    WRITE_FAILED
};

std::string downloadErrorName(DownloadError error);

/**
 * @brief Download result
 */
struct DownloadResult
{
    bool success;
    DownloadError error;
    std::string error_message;
    DownloadedImage image;

    DownloadResult() : success(false), error(DownloadError::NONE) {}
    static DownloadResult failure(DownloadError error, const std::string &message);
};

/**
 * @brief Metadata of a remote image that was fetched but not stored
 */
struct ProbeResult
{
    bool success;
    std::string error_message;
    ImageRecord record;
    std::string final_url;

    ProbeResult() : success(false) {}
};

/**
 * @brief Stores remote content under its content hash
 *
 * The file name is {MD5}{extension of the sniffed type} unless the caller
 * supplies one. Downloads are idempotent: an existing target is reported with
 * already_existed set and is not rewritten. New files are written to a
 * temporary name in the target directory and renamed into place.
 */
class ImageDownloader
{
public:
    // Called after every successful download, including already-present files
    using RecordSink = std::function<void(const DownloadedImage &)>;

    ImageDownloader();
    explicit ImageDownloader(FetchOptions options, RecordSink sink = nullptr);

    DownloadResult downloadTo(const std::string &url, const std::string &target_dir,
                              const std::optional<std::string> &filename_override = std::nullopt) const;

    /**
     * @brief Persist bytes that are already in memory
     *
     * Same classification, naming and atomic write as downloadTo; origin_url
     * is recorded as the source of the content.
     */
    DownloadResult saveContent(const std::vector<uint8_t> &content, const std::string &target_dir,
                               const std::string &origin_url,
                               const std::optional<std::string> &filename_override = std::nullopt) const;

    /**
     * @brief Persist bytes without a known signature when they still decode as an image
     *
     * The extension comes from the decoder's format ("pnm", "hdr", ...).
     * Content that does not decode is rejected as UNRECOGNIZED_CONTENT and
     * nothing is written.
     */
    DownloadResult saveDecodedContent(const std::vector<uint8_t> &content, const std::string &target_dir,
                                      const std::string &origin_url) const;

    // Fetch and describe an image without writing anything
    ProbeResult probeRemoteImage(const std::string &url) const;

    // True when the URL answers 200 within the redirect budget
    bool isAccessible(const std::string &url) const;

    void setRecordSink(RecordSink sink) { sink_ = std::move(sink); }
    const FetchOptions &options() const { return options_; }

private:
    DownloadResult persist(const std::vector<uint8_t> &content, ImageRecord record, const std::string &file_type,
                           const std::string &target_dir, const std::string &origin_url,
                           const std::optional<std::string> &filename_override) const;

    FetchOptions options_;
    RecordSink sink_;
};
