#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <functional>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *const kDefaultUserAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36";
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not found: " + path);
        return false;
    }

    try
    {
        // Parse into a scratch document so a broken file leaves the defaults untouched
        nlohmann::json loaded = nlohmann::json::parse(in);
        if (!loaded.is_object())
        {
            Logger::error("Configuration root must be a JSON object: " + path);
            return false;
        }
        update(loaded);
        Logger::info("Configuration loaded from file: " + path);
        return true;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.what());
        return false;
    }
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot open configuration file for writing: " + path);
        return false;
    }
    cfg_->save(out);
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Config key " + key + " is not an integer (" + e.displayText() + "), using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Config key " + key + " is not a boolean (" + e.displayText() + ")");
        return def;
    }
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

int PocoConfigManager::getDownloadTimeoutSeconds() const
{
    return getInt("download.timeout_seconds", 36);
}

int PocoConfigManager::getMaxRedirects() const
{
    return getInt("download.max_redirects", 5);
}

std::string PocoConfigManager::getUserAgent() const
{
    return getString("download.user_agent", kDefaultUserAgent);
}

int PocoConfigManager::getBatchTimeoutSeconds() const
{
    return getInt("batch.timeout_seconds", 60);
}

int PocoConfigManager::getRoundsPerSource() const
{
    return getInt("batch.rounds_per_source", 5);
}

int PocoConfigManager::getDedupMaxWorkers() const
{
    return getInt("dedup.max_workers", 0);
}

int PocoConfigManager::getDedupWorkerCeiling() const
{
    return getInt("dedup.worker_ceiling", 16);
}

std::string PocoConfigManager::getDedupCacheFile() const
{
    return getString("dedup.cache_file", "phash_cache.json");
}

std::map<std::string, bool> PocoConfigManager::getImageExtensionFlags() const
{
    std::map<std::string, bool> flags;
    auto images = getNestedConfig("categories.images");
    for (auto it = images.begin(); it != images.end(); ++it)
    {
        if (it.value().is_boolean())
        {
            std::string ext = it.key();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            flags[ext] = it.value().get<bool>();
        }
    }
    return flags;
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    std::vector<std::string> enabled;
    for (const auto &pair : getImageExtensionFlags())
    {
        if (pair.second)
        {
            enabled.push_back(pair.first);
        }
    }
    return enabled;
}

bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    int timeout = getDownloadTimeoutSeconds();
    if (timeout <= 0 || timeout > 3600)
    {
        Logger::error("Invalid download timeout: " + std::to_string(timeout));
        return false;
    }

    int batch_timeout = getBatchTimeoutSeconds();
    if (batch_timeout <= 0 || batch_timeout > 3600)
    {
        Logger::error("Invalid batch timeout: " + std::to_string(batch_timeout));
        return false;
    }

    int redirects = getMaxRedirects();
    if (redirects < 0 || redirects > 50)
    {
        Logger::error("Invalid redirect budget: " + std::to_string(redirects));
        return false;
    }

    if (getRoundsPerSource() < 0)
    {
        Logger::error("Invalid rounds per source: " + std::to_string(getRoundsPerSource()));
        return false;
    }

    int ceiling = getDedupWorkerCeiling();
    if (ceiling < 1 || ceiling > 256)
    {
        Logger::error("Invalid dedup worker ceiling: " + std::to_string(ceiling));
        return false;
    }

    if (getDedupMaxWorkers() < 0)
    {
        Logger::error("Invalid dedup max workers: " + std::to_string(getDedupMaxWorkers()));
        return false;
    }

    if (getEnabledImageExtensions().empty())
    {
        Logger::error("No image extensions enabled under categories.images");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();

    cfg_->setString("log_level", "INFO");

    // Download defaults
    cfg_->setInt("download.timeout_seconds", 36);
    cfg_->setInt("download.max_redirects", 5);
    cfg_->setString("download.user_agent", kDefaultUserAgent);

    // Batch acquisition defaults
    cfg_->setInt("batch.timeout_seconds", 60);
    cfg_->setInt("batch.rounds_per_source", 5);

    // Dedup defaults
    cfg_->setInt("dedup.max_workers", 0);
    cfg_->setInt("dedup.worker_ceiling", 16);
    cfg_->setString("dedup.cache_file", "phash_cache.json");

    // Extensions the directory scans treat as images
    cfg_->setBool("categories.images.jpg", true);
    cfg_->setBool("categories.images.jpeg", true);
    cfg_->setBool("categories.images.png", true);
    cfg_->setBool("categories.images.gif", true);
    cfg_->setBool("categories.images.bmp", true);
    cfg_->setBool("categories.images.webp", true);
    cfg_->setBool("categories.images.tiff", true);
    cfg_->setBool("categories.images.tif", true);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        std::stringstream ss;
        cfg_->save(ss);
        auto current = nlohmann::json::parse(ss.str());

        for (const auto &key : split(prefix, '.'))
        {
            if (current.contains(key) && current[key].is_object())
            {
                current = current[key];
            }
            else
            {
                return nlohmann::json::object();
            }
        }
        return current;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Could not read config section " + prefix + ": " + e.what());
        return nlohmann::json::object();
    }
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
