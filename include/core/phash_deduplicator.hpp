#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief Worker and candidate settings for a deduplication scan
 */
struct DedupOptions
{
    int max_workers;    // 0 selects the hardware concurrency
    int worker_ceiling; // Upper bound for any worker count
    std::vector<std::string> image_extensions; // Lowercase, without dot

    DedupOptions();

    // dedup.max_workers, dedup.worker_ceiling and the enabled categories.images keys
    static DedupOptions fromConfig();
};

/**
 * @brief What a deduplication run found and did
 */
struct DedupReport
{
    size_t candidates;     // Files passing the extension filter
    size_t cache_hits;     // Reused from the cache file
    size_t computed;       // Read and hashed in this run
    size_t hashed;         // Candidates with a non-empty perceptual hash
    size_t groups;         // Perceptual hashes shared by two or more files
    size_t removed;        // Duplicates deleted
    size_t failed_deletions;
    std::vector<std::string> removed_paths;

    DedupReport() : candidates(0), cache_hits(0), computed(0), hashed(0), groups(0), removed(0), failed_deletions(0) {}
};

/**
 * @brief Removes perceptual duplicates from a directory
 *
 * Candidate files are the regular files directly inside the directory whose
 * extension is an enabled image extension. Hashes are reused from the cache
 * file when the modification time is unchanged; the rest are computed in a
 * bounded TBB arena. Within every group of files sharing a perceptual hash
 * the largest file is kept (ties go to the lexicographically smallest name)
 * and the others are deleted. The cache is rewritten with exactly the files
 * seen in this run.
 *
 * Concurrent runs against the same directory or cache file are not supported.
 */
class PhashDeduplicator
{
public:
    PhashDeduplicator();
    explicit PhashDeduplicator(DedupOptions options);
    virtual ~PhashDeduplicator() = default;

    /**
     * @param max_workers Overrides the configured worker count when non-zero
     */
    DedupReport deduplicateDirectory(const std::string &directory, const std::string &cache_file, int max_workers = 0) const;

    // 0 -> min(ceiling, max(1, hardware threads)); explicit counts are clamped to [1, ceiling]
    static int resolveWorkerCount(int requested, int ceiling);

    bool isCandidate(const std::string &file_path) const;

    const DedupOptions &options() const { return options_; }

protected:
    // Deletes one duplicate; false (with ec set when known) leaves it counted as a failed deletion
    virtual bool removeDuplicate(const std::filesystem::path &victim, std::error_code &ec) const;

private:
    DedupOptions options_;
};
