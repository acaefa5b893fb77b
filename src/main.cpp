#include "core/batch_acquirer.hpp"
#include "core/file_utils.hpp"
#include "core/image_downloader.hpp"
#include "core/image_info_extractor.hpp"
#include "core/image_organizer.hpp"
#include "core/phash_deduplicator.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{
    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitUsage = 2;

    void printUsage(const char *program)
    {
        std::cout << "imgharvest - image acquisition and deduplication" << std::endl;
        std::cout << "Usage: " << program << " [--config FILE] [--log-level LEVEL] <command> [args]" << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  download URL DIR [NAME]             Download one image into DIR" << std::endl;
        std::cout << "  probe URL                           Print metadata of a remote image" << std::endl;
        std::cout << "  acquire DIR [ROUNDS] URL...         Poll image sources ROUNDS times each" << std::endl;
        std::cout << "                                      (default batch.rounds_per_source)" << std::endl;
        std::cout << "  dedup DIR [CACHE] [WORKERS]         Remove perceptual duplicates from DIR" << std::endl;
        std::cout << "  fix-ext DIR [TARGET]                Rename files to {md5}{detected extension}" << std::endl;
        std::cout << "  filter DIR MINW MINH [MAXW MAXH]    List images within a size range" << std::endl;
        std::cout << "  classify DIR                        Copy images into horizontal/ and vertical/" << std::endl;
        std::cout << "  split IMAGE ROWS COLS OUTDIR [PREFIX]  Cut an image into grid cells" << std::endl;
        std::cout << "  info FILE                           Print metadata of a local file" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE, -c FILE    JSON configuration file" << std::endl;
        std::cout << "  --log-level LEVEL         TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h                Show this help message" << std::endl;
    }

    std::optional<int> parseInt(const std::string &text)
    {
        try
        {
            size_t consumed = 0;
            int value = std::stoi(text, &consumed);
            if (consumed != text.size())
                return std::nullopt;
            return value;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    void printRecord(const ImageRecord &record)
    {
        std::cout << "size:        " << record.size_bytes << std::endl;
        std::cout << "md5:         " << record.content_hash << std::endl;
        std::cout << "type:        " << (record.file_type.empty() ? "unknown" : record.file_type) << std::endl;
        std::cout << "dimensions:  " << record.width << "x" << record.height << std::endl;
        std::cout << "orientation: " << orientationName(record.orientation) << std::endl;
        std::cout << "phash:       " << (record.perceptual_hash.empty() ? "-" : record.perceptual_hash) << std::endl;
        if (record.repaired)
            std::cout << "repaired:    yes" << std::endl;
    }

    int runDownload(const std::vector<std::string> &args)
    {
        if (args.size() < 2 || args.size() > 3)
            return kExitUsage;
        std::optional<std::string> name;
        if (args.size() == 3)
            name = args[2];

        ImageDownloader downloader;
        DownloadResult result = downloader.downloadTo(args[0], args[1], name);
        if (!result.success)
        {
            std::cerr << downloadErrorName(result.error) << ": " << result.error_message << std::endl;
            return kExitFailure;
        }
        std::cout << result.image.file_path << (result.image.already_existed ? " (already present)" : "") << std::endl;
        return kExitSuccess;
    }

    int runProbe(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            return kExitUsage;
        ImageDownloader downloader;
        ProbeResult probe = downloader.probeRemoteImage(args[0]);
        if (!probe.success)
        {
            std::cerr << probe.error_message << std::endl;
            return kExitFailure;
        }
        std::cout << "url:         " << probe.final_url << std::endl;
        printRecord(probe.record);
        return kExitSuccess;
    }

    int runAcquire(const std::vector<std::string> &args)
    {
        if (args.size() < 2)
            return kExitUsage;

        BatchAcquirer acquirer;
        size_t first_source = 1;
        if (auto rounds = parseInt(args[1]))
        {
            if (*rounds < 0)
                return kExitUsage;
            acquirer.setRoundsPerSource(*rounds);
            first_source = 2;
        }
        if (first_source >= args.size())
            return kExitUsage;

        std::vector<std::string> sources(args.begin() + first_source, args.end());
        BatchSummary summary = acquirer.acquireFromSources(sources, args[0]);
        for (const auto &detail : summary.details)
        {
            std::cout << detail.round << "\t" << acquisitionKindName(detail.kind) << "\t" << detail.source << "\t"
                      << (detail.kind == AcquisitionKind::FAILED ? detail.error : detail.file_path) << std::endl;
        }
        std::cout << "succeeded: " << summary.success_count << ", failed: " << summary.failure_count << std::endl;
        return summary.failure_count == 0 ? kExitSuccess : kExitFailure;
    }

    int runDedup(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 3)
            return kExitUsage;
        std::string cache = args.size() > 1
                                ? args[1]
                                : (std::filesystem::path(args[0]) / PocoConfigManager::getInstance().getDedupCacheFile()).string();
        int workers = 0;
        if (args.size() > 2)
        {
            auto parsed = parseInt(args[2]);
            if (!parsed || *parsed < 0)
                return kExitUsage;
            workers = *parsed;
        }

        if (!FileUtils::isValidDirectory(args[0]))
        {
            std::cerr << "Not a directory: " << args[0] << std::endl;
            return kExitFailure;
        }

        PhashDeduplicator deduplicator;
        DedupReport report = deduplicator.deduplicateDirectory(args[0], cache, workers);
        for (const auto &path : report.removed_paths)
            std::cout << "removed " << path << std::endl;
        std::cout << report.candidates << " candidates, " << report.cache_hits << " cached, " << report.computed
                  << " hashed now, " << report.groups << " duplicate groups, " << report.removed << " removed" << std::endl;
        return report.failed_deletions == 0 ? kExitSuccess : kExitFailure;
    }

    int runFixExtensions(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
            return kExitUsage;
        if (!FileUtils::isValidDirectory(args[0]))
        {
            std::cerr << "Not a directory: " << args[0] << std::endl;
            return kExitFailure;
        }
        size_t renamed = ImageOrganizer::batchCorrectExtensions(args[0], args.size() > 1 ? args[1] : "");
        std::cout << renamed << " files renamed" << std::endl;
        return kExitSuccess;
    }

    int runFilter(const std::vector<std::string> &args)
    {
        if (args.size() != 3 && args.size() != 5)
            return kExitUsage;
        std::vector<uint32_t> bounds;
        for (size_t i = 1; i < args.size(); ++i)
        {
            auto parsed = parseInt(args[i]);
            if (!parsed || *parsed < 0)
                return kExitUsage;
            bounds.push_back(static_cast<uint32_t>(*parsed));
        }

        std::vector<ImageFileInfo> matches = bounds.size() == 4
                                                 ? ImageOrganizer::filterImagesBySize(args[0], bounds[0], bounds[1], bounds[2], bounds[3])
                                                 : ImageOrganizer::filterImagesBySize(args[0], bounds[0], bounds[1]);
        for (const auto &match : matches)
            std::cout << match.file_path << "\t" << match.record.width << "x" << match.record.height << std::endl;
        return kExitSuccess;
    }

    int runClassify(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            return kExitUsage;
        if (!FileUtils::isValidDirectory(args[0]))
        {
            std::cerr << "Not a directory: " << args[0] << std::endl;
            return kExitFailure;
        }
        OrientationCounts counts = ImageOrganizer::classifyByOrientation(args[0]);
        std::cout << counts.horizontal << " horizontal, " << counts.vertical << " vertical, " << counts.skipped << " skipped" << std::endl;
        return kExitSuccess;
    }

    int runSplit(const std::vector<std::string> &args)
    {
        if (args.size() < 4 || args.size() > 5)
            return kExitUsage;
        auto rows = parseInt(args[1]);
        auto cols = parseInt(args[2]);
        if (!rows || !cols || *rows <= 0 || *cols <= 0)
            return kExitUsage;

        auto outputs = ImageOrganizer::splitImageByGrid(args[0], *rows, *cols, args[3], args.size() > 4 ? args[4] : "split");
        for (const auto &path : outputs)
            std::cout << path << std::endl;
        return outputs.empty() ? kExitFailure : kExitSuccess;
    }

    int runInfo(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            return kExitUsage;
        auto content = FileUtils::readFileBytes(args[0]);
        if (!content)
        {
            std::cerr << "Cannot read " << args[0] << std::endl;
            return kExitFailure;
        }
        printRecord(ImageInfoExtractor::extractInfo(*content));
        return kExitSuccess;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string log_level;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return kExitSuccess;
        }
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            log_level = argv[++i];
        }
        else if (arg.rfind("--", 0) == 0 && positional.empty())
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    auto &config_manager = PocoConfigManager::getInstance();
    Logger::init("INFO");
    if (!config_path.empty() && !config_manager.load(config_path))
    {
        std::cerr << "Failed to load configuration: " << config_path << std::endl;
        return kExitFailure;
    }

    // Initialize logger with configured log level, the command line wins
    Logger::init(log_level.empty() ? config_manager.getLogLevel() : log_level);

    if (positional.empty())
    {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::string command = positional.front();
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    int exit_code = kExitUsage;
    if (command == "download")
        exit_code = runDownload(args);
    else if (command == "probe")
        exit_code = runProbe(args);
    else if (command == "acquire")
        exit_code = runAcquire(args);
    else if (command == "dedup")
        exit_code = runDedup(args);
    else if (command == "fix-ext")
        exit_code = runFixExtensions(args);
    else if (command == "filter")
        exit_code = runFilter(args);
    else if (command == "classify")
        exit_code = runClassify(args);
    else if (command == "split")
        exit_code = runSplit(args);
    else if (command == "info")
        exit_code = runInfo(args);
    else
        std::cerr << "Unknown command: " << command << std::endl;

    if (exit_code == kExitUsage)
        printUsage(argv[0]);
    return exit_code;
}
