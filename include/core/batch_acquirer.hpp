#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/content_fetcher.hpp"
#include "core/image_downloader.hpp"

enum class AcquisitionKind
{
    JSON,   // Source answered with JSON naming the image
    DIRECT, // Source answered with the image itself
    FAILED
};

std::string acquisitionKindName(AcquisitionKind kind);

/**
 * @brief One (source, round) attempt
 */
struct AcquisitionDetail
{
    std::string source;
    int round; // 1-based
    AcquisitionKind kind;
    std::string reference; // Image URL from JSON, or the source itself for direct images
    std::string file_path;
    std::string error;

    AcquisitionDetail() : round(0), kind(AcquisitionKind::FAILED) {}
};

struct BatchSummary
{
    int success_count;
    int failure_count;
    std::vector<AcquisitionDetail> details;

    BatchSummary() : success_count(0), failure_count(0) {}
};

/**
 * @brief Polls image source endpoints for a number of rounds
 *
 * Each round visits every source once, in order. A source may answer with a
 * JSON document that names an image (downloaded through ImageDownloader) or
 * with the image bytes directly. Failures are recorded per attempt; the
 * batch itself never aborts. Requests are issued sequentially.
 */
class BatchAcquirer
{
public:
    // Extracts the image reference from a JSON response
    using ReferenceParser = std::function<std::optional<std::string>(const nlohmann::json &)>;

    // Source requests use batch.timeout_seconds, image downloads the download settings.
    // Both constructors take the round count from batch.rounds_per_source.
    BatchAcquirer();
    BatchAcquirer(FetchOptions source_options, ImageDownloader downloader);

    BatchSummary acquireFromSources(const std::vector<std::string> &source_urls, const std::string &target_dir,
                                    int rounds_per_source, ReferenceParser parser = nullptr) const;

    // Runs the configured number of rounds with the default parser
    BatchSummary acquireFromSources(const std::vector<std::string> &source_urls, const std::string &target_dir) const;

    int roundsPerSource() const { return rounds_per_source_; }
    void setRoundsPerSource(int rounds) { rounds_per_source_ = rounds; }

    /**
     * @brief Default reference lookup
     *
     * Tries the top-level keys "url", "img" and "text", then data[0].url and
     * data[0].urls.original. Non-string values are used in their JSON text form.
     */
    static std::optional<std::string> defaultReferenceParser(const nlohmann::json &document);

    // Trimmed, non-empty, first occurrence of each source
    static std::vector<std::string> cleanSources(const std::vector<std::string> &source_urls);

    // Absolute URL for a reference found in a response from source_url
    static std::string absolutizeReference(const std::string &source_url, const std::string &reference);

private:
    AcquisitionDetail acquireOnce(const std::string &source, int round, const std::string &target_dir,
                                  const ReferenceParser &parser) const;

    FetchOptions source_options_;
    ImageDownloader downloader_;
    int rounds_per_source_;
};
