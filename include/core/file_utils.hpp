#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <optional>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Size and modification token of a file, used for cache invalidation
 */
struct FileMetadata
{
    std::string file_path;
    int64_t modification_time; // last_write_time ticks, only compared for equality
    uint64_t file_size;

    FileMetadata() : modification_time(0), file_size(0) {}
};

/**
 * @brief Filesystem helpers shared by the downloader, deduplicator and organizer
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata without reading the content
     * @return std::nullopt if the path is not an accessible regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to descend into subdirectories
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    // Collects the regular files of a directory, sorted by path
    static std::vector<std::string> listFiles(const std::string &dir_path, bool recursive = false);

    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Read a whole file into memory
     * @return std::nullopt if the file cannot be opened or read
     */
    static std::optional<std::vector<uint8_t>> readFileBytes(const std::string &file_path);

    /**
     * @brief Write bytes through a temporary file in the same directory, then rename
     *
     * Readers never observe a partially written target. On failure the
     * temporary file is removed and error_message (when given) is filled.
     */
    static bool writeFileAtomically(const std::string &file_path, const std::vector<uint8_t> &data,
                                    std::string *error_message = nullptr);

    /**
     * Computes the MD5 of a file
     * @return Uppercase hex digest, empty string on error
     */
    static std::string computeFileHash(const std::string &file_path);

    // Lowercase extension without the dot ("JPG" -> "jpg")
    static std::string lowercaseExtension(const std::string &file_path);

private:
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);
};
