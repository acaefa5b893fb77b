#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Corruption patterns the repair pass knows how to fix
 */
enum class CorruptionKind
{
    NONE,
    JPEG_METADATA, // APPn/COM segments present or malformed before the scan data
    PNG_CHUNKS     // CRC mismatches, oversized palette transparency, damaged metadata chunks
};

/**
 * @brief One-shot repair of images that fail to decode
 *
 * Repair strips or rebuilds the container structures that commonly break
 * decoders (EXIF blocks, ICC profiles, tRNS tables longer than the palette,
 * chunk checksums) and re-encodes the decoded pixels into a clean buffer.
 * It never recurses: callers decode the returned bytes without repairing again.
 */
class ImageRepair
{
public:
    /**
     * @brief Inspect a buffer that failed to decode for a repairable pattern
     */
    static CorruptionKind detectCorruption(const std::vector<uint8_t> &data);

    /**
     * @brief Sanitise, decode and re-encode a corrupted buffer
     * @return Clean encoded bytes, or std::nullopt when the image cannot be salvaged
     */
    static std::optional<std::vector<uint8_t>> repair(const std::vector<uint8_t> &data, CorruptionKind kind);

    // Drop APP1..APP15 and COM segments, resynchronising after bad segment lengths
    static std::vector<uint8_t> sanitizeJpeg(const std::vector<uint8_t> &data);

    // Rebuild the chunk list with valid CRCs, palette-sized tRNS and no metadata chunks
    static std::vector<uint8_t> sanitizePng(const std::vector<uint8_t> &data);

    /**
     * @brief Encode pixels into a clean buffer of the given format
     *
     * JPEG output drops alpha and uses quality 95; PNG and WebP keep the alpha
     * channel (WebP is written lossless).
     */
    static std::optional<std::vector<uint8_t>> reencode(const cv::Mat &image, const std::string &file_type);

    static uint32_t pngChunkCrc(const std::string &type, const uint8_t *data, size_t length);
};
