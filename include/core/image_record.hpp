#pragma once

#include <cstdint>
#include <string>

enum class ImageOrientation
{
    HORIZONTAL,
    VERTICAL,
    UNKNOWN
};

/**
 * @brief Metadata describing one blob of downloaded or scanned content
 *
 * size_bytes and content_hash always describe the bytes that were handed to
 * the extractor. The image fields stay empty/zero when the bytes do not decode.
 */
struct ImageRecord
{
    uint64_t size_bytes;
    std::string content_hash;    // Uppercase hex MD5
    std::string perceptual_hash; // Uppercase hex 64-bit pHash, empty if undecodable
    std::string file_type;       // Lowercase tag ("jpeg", "png", ...), empty if unknown
    uint32_t width;
    uint32_t height;
    ImageOrientation orientation;
    bool repaired; // Image fields were taken from a repaired copy

    ImageRecord() : size_bytes(0), width(0), height(0), orientation(ImageOrientation::UNKNOWN), repaired(false) {}

    bool isDecodedImage() const { return width > 0 && height > 0; }
};

/**
 * @brief Horizontal when wider than tall, Vertical otherwise, Unknown without dimensions
 */
inline ImageOrientation orientationFor(uint32_t width, uint32_t height)
{
    if (width == 0 || height == 0)
        return ImageOrientation::UNKNOWN;
    return width > height ? ImageOrientation::HORIZONTAL : ImageOrientation::VERTICAL;
}

inline std::string orientationName(ImageOrientation orientation)
{
    switch (orientation)
    {
    case ImageOrientation::HORIZONTAL:
        return "horizontal";
    case ImageOrientation::VERTICAL:
        return "vertical";
    default:
        return "unknown";
    }
}

/**
 * @brief An ImageRecord that has been persisted to a local file
 */
struct DownloadedImage
{
    ImageRecord record;
    std::string file_path;
    std::string origin_url;
    bool already_existed;

    DownloadedImage() : already_existed(false) {}
};
