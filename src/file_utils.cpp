#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

std::vector<std::string> FileUtils::listFiles(const std::string &dir_path, bool recursive)
{
    std::vector<std::string> files;
    listFilesAsObservable(dir_path, recursive).subscribe([&files](const std::string &path)
                                                         { files.push_back(path); });
    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Log the error but don't stop the entire scan
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    try
    {
        fs::path path(file_path);
        if (!fs::is_regular_file(path))
        {
            return std::nullopt;
        }

        FileMetadata metadata;
        metadata.file_path = file_path;
        metadata.modification_time = static_cast<int64_t>(fs::last_write_time(path).time_since_epoch().count());
        metadata.file_size = fs::file_size(path);
        return metadata;
    }
    catch (const fs::filesystem_error &e)
    {
        Logger::error("Error getting file metadata for " + file_path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<uint8_t>> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
    {
        Logger::warn("Could not open file for reading: " + file_path);
        return std::nullopt;
    }

    std::streamsize size = file.tellg();
    if (size < 0)
    {
        Logger::warn("Could not determine size of file: " + file_path);
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char *>(data.data()), size))
    {
        Logger::warn("Short read on file: " + file_path);
        return std::nullopt;
    }
    return data;
}

bool FileUtils::writeFileAtomically(const std::string &file_path, const std::vector<uint8_t> &data,
                                    std::string *error_message)
{
    auto fail = [error_message](const std::string &msg)
    {
        Logger::warn(msg);
        if (error_message)
        {
            *error_message = msg;
        }
        return false;
    };

    fs::path target(file_path);
    fs::path directory = target.has_parent_path() ? target.parent_path() : fs::path(".");

    std::random_device rd;
    std::stringstream suffix;
    suffix << ".tmp-" << std::hex << rd() << rd();
    fs::path temp = directory / ("." + target.filename().string() + suffix.str());

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            return fail("Could not create temporary file: " + temp.string());
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ec;
            fs::remove(temp, ec);
            return fail("Failed writing temporary file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec)
    {
        std::error_code cleanup_ec;
        fs::remove(temp, cleanup_ec);
        return fail("Failed to move " + temp.string() + " into place: " + ec.message());
    }
    return true;
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    constexpr size_t buffer_size = 8192;
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        return "";

    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                return "";
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1)
        return "";
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_length; ++i)
        ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::string FileUtils::lowercaseExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}
