#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One entry of the magic-number table
 */
struct FileSignature
{
    std::string magic; // Raw signature bytes
    std::string file_type;
};

/**
 * @brief Classifies byte buffers by their leading magic numbers
 *
 * Pure functions only. The signature table is ordered: the first entry whose
 * bytes prefix the input wins, so specific signatures sit before the shorter
 * generic ones they overlap with.
 */
class FileTypeSniffer
{
public:
    // Number of leading bytes callers should hand to identifyType
    static constexpr size_t kSniffLength = 32;

    /**
     * @brief Identify the file type of a buffer
     * @param data Leading bytes of the content (at least kSniffLength recommended)
     * @param size Number of bytes available
     * @return Lowercase type tag, or std::nullopt when nothing matches
     */
    static std::optional<std::string> identifyType(const uint8_t *data, size_t size);
    static std::optional<std::string> identifyType(const std::vector<uint8_t> &data);

    /**
     * @brief File extension (with dot) for a type tag, ".<tag>" when unmapped
     */
    static std::string extensionFor(const std::string &file_type);

    /**
     * @brief True for raster formats the pipeline stores as images
     */
    static bool isRasterImageType(const std::string &file_type);

    static const std::vector<FileSignature> &signatureTable();
};
