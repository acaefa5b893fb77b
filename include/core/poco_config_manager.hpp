#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-backed configuration for the acquisition and dedup pipeline
 *
 * Values are addressed with dotted keys ("download.timeout_seconds").
 * Every getter falls back to the built-in default when the key is absent.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    std::string getLogLevel() const;

    // Download / fetch configuration
    int getDownloadTimeoutSeconds() const;
    int getMaxRedirects() const;
    std::string getUserAgent() const;

    // Batch acquisition configuration
    int getBatchTimeoutSeconds() const;
    int getRoundsPerSource() const;

    // Deduplication configuration
    int getDedupMaxWorkers() const;
    int getDedupWorkerCeiling() const;
    std::string getDedupCacheFile() const;

    // Image extensions considered by directory scans (lowercase, no dot)
    std::map<std::string, bool> getImageExtensionFlags() const;
    std::vector<std::string> getEnabledImageExtensions() const;

    bool validateConfig() const;

    // Restores the built-in defaults, dropping anything loaded or patched
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    nlohmann::json getNestedConfig(const std::string &prefix) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
