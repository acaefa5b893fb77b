#include "core/phash_cache.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

bool PhashCache::load(const std::string &cache_file)
{
    entries_.clear();

    std::ifstream in(cache_file);
    if (!in.good())
    {
        Logger::debug("No pHash cache at " + cache_file + ", starting empty");
        return true;
    }

    nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object())
    {
        Logger::warn("Ignoring malformed pHash cache: " + cache_file);
        return false;
    }

    for (auto it = document.begin(); it != document.end(); ++it)
    {
        try
        {
            const auto &value = it.value();
            PhashCacheEntry entry;
            entry.perceptual_hash = value.at("perceptualHash").get<std::string>();
            entry.size_bytes = value.at("sizeBytes").get<uint64_t>();
            entry.modified_time = value.at("modifiedTime").get<int64_t>();
            entry.path = value.value("path", std::string());
            entries_[it.key()] = entry;
        }
        catch (const nlohmann::json::exception &e)
        {
            Logger::debug("Skipping cache entry " + it.key() + ": " + e.what());
        }
    }

    Logger::debug("Loaded " + std::to_string(entries_.size()) + " pHash cache entries from " + cache_file);
    return true;
}

bool PhashCache::save(const std::string &cache_file) const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto &[filename, entry] : entries_)
    {
        document[filename] = {
            {"perceptualHash", entry.perceptual_hash},
            {"sizeBytes", entry.size_bytes},
            {"modifiedTime", entry.modified_time},
            {"path", entry.path}};
    }

    std::string text = document.dump(2);
    std::string error;
    if (!FileUtils::writeFileAtomically(cache_file, std::vector<uint8_t>(text.begin(), text.end()), &error))
    {
        Logger::error("Failed to save pHash cache: " + error);
        return false;
    }
    return true;
}

std::optional<PhashCacheEntry> PhashCache::lookup(const std::string &filename, int64_t modified_time) const
{
    auto it = entries_.find(filename);
    if (it == entries_.end() || it->second.modified_time != modified_time)
    {
        return std::nullopt;
    }
    return it->second;
}

void PhashCache::put(const std::string &filename, const PhashCacheEntry &entry)
{
    entries_[filename] = entry;
}
