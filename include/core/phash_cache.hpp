#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

/**
 * @brief Cached perceptual hash of one file
 *
 * An empty perceptual_hash records that the file did not decode at this
 * modification time, so it is not decoded again until it changes.
 */
struct PhashCacheEntry
{
    std::string perceptual_hash;
    uint64_t size_bytes;
    int64_t modified_time;
    std::string path;

    PhashCacheEntry() : size_bytes(0), modified_time(0) {}
};

/**
 * @brief Filename -> PhashCacheEntry map persisted as a flat JSON object
 *
 * Format: {"<filename>": {"perceptualHash": "...", "sizeBytes": n,
 * "modifiedTime": n, "path": "..."}, ...}
 */
class PhashCache
{
public:
    /**
     * @brief Replace the contents with the cache file
     *
     * A missing file yields an empty cache. A malformed file is logged and
     * also yields an empty cache; malformed individual entries are skipped.
     * @return false if the file existed but could not be used
     */
    bool load(const std::string &cache_file);

    // Written atomically; returns false and logs on failure
    bool save(const std::string &cache_file) const;

    // Entry for filename if its stored modification time equals modified_time
    std::optional<PhashCacheEntry> lookup(const std::string &filename, int64_t modified_time) const;

    void put(const std::string &filename, const PhashCacheEntry &entry);
    void erase(const std::string &filename) { entries_.erase(filename); }

    const std::map<std::string, PhashCacheEntry> &entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    std::map<std::string, PhashCacheEntry> entries_;
};
