#include "core/phash_deduplicator.hpp"
#include "core/file_utils.hpp"
#include "core/image_info_extractor.hpp"
#include "core/phash_cache.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace fs = std::filesystem;

namespace
{
    constexpr int kDefaultWorkerCeiling = 16;

    struct Candidate
    {
        std::string filename;
        std::string path;
        int64_t modified_time;
    };
}

DedupOptions::DedupOptions()
    : max_workers(0), worker_ceiling(kDefaultWorkerCeiling),
      image_extensions({"jpg", "jpeg", "png", "gif", "bmp", "webp", "tiff", "tif"})
{
}

DedupOptions DedupOptions::fromConfig()
{
    auto &config = PocoConfigManager::getInstance();
    DedupOptions options;
    options.max_workers = config.getDedupMaxWorkers();
    options.worker_ceiling = config.getDedupWorkerCeiling();
    options.image_extensions = config.getEnabledImageExtensions();
    return options;
}

PhashDeduplicator::PhashDeduplicator()
    : options_(DedupOptions::fromConfig())
{
}

PhashDeduplicator::PhashDeduplicator(DedupOptions options)
    : options_(std::move(options))
{
}

int PhashDeduplicator::resolveWorkerCount(int requested, int ceiling)
{
    int limit = std::max(1, ceiling);
    if (requested <= 0)
    {
        int hardware = static_cast<int>(std::thread::hardware_concurrency());
        return std::min(limit, std::max(1, hardware));
    }
    return std::min(limit, requested);
}

bool PhashDeduplicator::isCandidate(const std::string &file_path) const
{
    std::string ext = FileUtils::lowercaseExtension(file_path);
    return !ext.empty() &&
           std::find(options_.image_extensions.begin(), options_.image_extensions.end(), ext) != options_.image_extensions.end();
}

bool PhashDeduplicator::removeDuplicate(const fs::path &victim, std::error_code &ec) const
{
    return fs::remove(victim, ec);
}

DedupReport PhashDeduplicator::deduplicateDirectory(const std::string &directory, const std::string &cache_file, int max_workers) const
{
    DedupReport report;
    if (!FileUtils::isValidDirectory(directory))
    {
        Logger::error("Deduplication target is not a directory: " + directory);
        return report;
    }

    // Extension filter first, nothing is decoded for the rest
    std::vector<Candidate> candidates;
    for (const auto &path : FileUtils::listFiles(directory, false))
    {
        if (!isCandidate(path))
            continue;
        auto metadata = FileUtils::getFileMetadata(path);
        if (!metadata)
            continue;
        candidates.push_back({fs::path(path).filename().string(), path, metadata->modification_time});
    }
    report.candidates = candidates.size();

    PhashCache previous;
    previous.load(cache_file);

    PhashCache current;
    std::vector<const Candidate *> misses;
    for (const auto &candidate : candidates)
    {
        auto cached = previous.lookup(candidate.filename, candidate.modified_time);
        if (cached)
        {
            current.put(candidate.filename, *cached);
            report.cache_hits++;
        }
        else
        {
            misses.push_back(&candidate);
        }
    }

    int workers = resolveWorkerCount(max_workers != 0 ? max_workers : options_.max_workers, options_.worker_ceiling);
    Logger::info("Deduplicating " + directory + ": " + std::to_string(candidates.size()) + " candidates, " +
                 std::to_string(report.cache_hits) + " cached, " + std::to_string(misses.size()) + " to hash with " +
                 std::to_string(workers) + " workers");

    std::mutex merge_mutex;
    tbb::task_arena arena(workers);
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, misses.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              const Candidate &candidate = *misses[i];
                                              auto content = FileUtils::readFileBytes(candidate.path);
                                              if (!content)
                                              {
                                                  Logger::warn("Skipping unreadable file: " + candidate.path);
                                                  continue;
                                              }

                                              ImageRecord record = ImageInfoExtractor::extractInfo(*content);
                                              PhashCacheEntry entry;
                                              entry.perceptual_hash = record.perceptual_hash;
                                              entry.size_bytes = record.size_bytes;
                                              entry.modified_time = candidate.modified_time;
                                              entry.path = candidate.path;
                                              if (entry.perceptual_hash.empty())
                                              {
                                                  Logger::debug("No perceptual hash for " + candidate.path);
                                              }

                                              std::lock_guard<std::mutex> lock(merge_mutex);
                                              current.put(candidate.filename, entry);
                                              report.computed++;
                                          }
                                      }); });

    std::unordered_map<std::string, std::vector<std::pair<std::string, PhashCacheEntry>>> groups;
    for (const auto &[filename, entry] : current.entries())
    {
        if (entry.perceptual_hash.empty())
            continue;
        report.hashed++;
        groups[entry.perceptual_hash].emplace_back(filename, entry);
    }

    for (auto &[phash, members] : groups)
    {
        if (members.size() < 2)
            continue;
        report.groups++;

        std::sort(members.begin(), members.end(), [](const auto &a, const auto &b)
                  {
                      if (a.second.size_bytes != b.second.size_bytes)
                          return a.second.size_bytes > b.second.size_bytes;
                      return a.first < b.first; });

        Logger::debug("Keeping " + members.front().first + " for pHash " + phash);
        for (size_t i = 1; i < members.size(); ++i)
        {
            fs::path victim = fs::path(directory) / members[i].first;
            std::error_code ec;
            if (removeDuplicate(victim, ec))
            {
                report.removed++;
                report.removed_paths.push_back(victim.string());
                current.erase(members[i].first);
                Logger::info("Removed duplicate " + victim.string() + " (kept " + members.front().first + ")");
            }
            else
            {
                report.failed_deletions++;
                Logger::warn("Failed to remove duplicate " + victim.string() + (ec ? ": " + ec.message() : ""));
            }
        }
    }

    current.save(cache_file);

    Logger::info("Deduplication of " + directory + " finished: " + std::to_string(report.groups) + " groups, " +
                 std::to_string(report.removed) + " removed");
    return report;
}
