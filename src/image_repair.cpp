#include "core/image_repair.hpp"
#include "core/file_type_sniffer.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <zlib.h>
#include <cctype>
#include <cstring>
#include <unordered_set>

namespace
{
    const uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    // Ancillary chunks that only carry metadata and are dropped on repair
    const std::unordered_set<std::string> kPngMetadataChunks = {
        "eXIf", "tEXt", "zTXt", "iTXt", "iCCP", "tIME"};

    uint32_t readBE32(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    uint16_t readBE16(const uint8_t *p)
    {
        return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }

    void appendBE32(std::vector<uint8_t> &out, uint32_t value)
    {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    void appendPngChunk(std::vector<uint8_t> &out, const std::string &type, const uint8_t *data, size_t length)
    {
        appendBE32(out, static_cast<uint32_t>(length));
        out.insert(out.end(), type.begin(), type.end());
        if (length > 0)
            out.insert(out.end(), data, data + length);
        appendBE32(out, ImageRepair::pngChunkCrc(type, data, length));
    }

    bool isPng(const std::vector<uint8_t> &data)
    {
        return data.size() >= 8 && std::memcmp(data.data(), kPngSignature, 8) == 0;
    }

    bool isJpeg(const std::vector<uint8_t> &data)
    {
        return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
    }

    bool isAppOrComment(uint8_t marker)
    {
        return (marker >= 0xE1 && marker <= 0xEF) || marker == 0xFE;
    }

    bool isStandaloneMarker(uint8_t marker)
    {
        return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
    }

    // Markers a resynchronisation may land on
    bool isSegmentMarker(uint8_t marker)
    {
        return (marker >= 0xC0 && marker <= 0xCF) || marker == 0xDA || marker == 0xDB ||
               marker == 0xDD || marker == 0xD9 || (marker >= 0xE0 && marker <= 0xEF) || marker == 0xFE;
    }

    size_t resyncJpeg(const std::vector<uint8_t> &data, size_t from)
    {
        for (size_t i = from; i + 1 < data.size(); ++i)
        {
            if (data[i] == 0xFF && isSegmentMarker(data[i + 1]))
                return i;
        }
        return data.size();
    }

    bool jpegSegmentValid(const std::vector<uint8_t> &data, size_t pos, size_t &end)
    {
        if (pos + 4 > data.size())
            return false;
        uint16_t length = readBE16(&data[pos + 2]);
        end = pos + 2 + length;
        return length >= 2 && end <= data.size() && (end == data.size() || data[end] == 0xFF);
    }
}

uint32_t ImageRepair::pngChunkCrc(const std::string &type, const uint8_t *data, size_t length)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef *>(type.data()), static_cast<uInt>(type.size()));
    if (length > 0)
        crc = crc32(crc, reinterpret_cast<const Bytef *>(data), static_cast<uInt>(length));
    return static_cast<uint32_t>(crc);
}

CorruptionKind ImageRepair::detectCorruption(const std::vector<uint8_t> &data)
{
    if (isJpeg(data))
    {
        size_t pos = 2;
        while (pos + 1 < data.size())
        {
            if (data[pos] != 0xFF)
                return CorruptionKind::JPEG_METADATA; // Segment boundary lost
            uint8_t marker = data[pos + 1];
            if (marker == 0xFF)
            {
                ++pos; // Fill byte
                continue;
            }
            if (marker == 0xDA || marker == 0xD9)
                break;
            if (isStandaloneMarker(marker))
            {
                pos += 2;
                continue;
            }
            size_t end = 0;
            if (!jpegSegmentValid(data, pos, end))
                return CorruptionKind::JPEG_METADATA;
            // Metadata segments are stripped on repair even when well formed
            if (isAppOrComment(marker))
                return CorruptionKind::JPEG_METADATA;
            pos = end;
        }
        return CorruptionKind::NONE;
    }

    if (isPng(data))
    {
        size_t pos = 8;
        size_t palette_entries = 0;
        while (pos + 8 <= data.size())
        {
            uint32_t length = readBE32(&data[pos]);
            std::string type(reinterpret_cast<const char *>(&data[pos + 4]), 4);
            if (pos + 12 + static_cast<size_t>(length) > data.size())
                return CorruptionKind::PNG_CHUNKS; // Truncated chunk
            const uint8_t *payload = &data[pos + 8];
            uint32_t stored_crc = readBE32(payload + length);
            if (stored_crc != pngChunkCrc(type, payload, length))
                return CorruptionKind::PNG_CHUNKS;
            if (type == "PLTE")
                palette_entries = length / 3;
            if (type == "tRNS" && palette_entries > 0 && length > palette_entries)
                return CorruptionKind::PNG_CHUNKS;
            if (kPngMetadataChunks.count(type) > 0)
                return CorruptionKind::PNG_CHUNKS;
            if (type == "IEND")
                break;
            pos += 12 + length;
        }
        return CorruptionKind::NONE;
    }

    return CorruptionKind::NONE;
}

std::vector<uint8_t> ImageRepair::sanitizeJpeg(const std::vector<uint8_t> &data)
{
    std::vector<uint8_t> out;
    if (!isJpeg(data))
        return out;

    out.reserve(data.size());
    out.push_back(0xFF);
    out.push_back(0xD8);

    size_t pos = 2;
    while (pos + 1 < data.size())
    {
        if (data[pos] != 0xFF)
        {
            pos = resyncJpeg(data, pos);
            continue;
        }
        uint8_t marker = data[pos + 1];
        if (marker == 0xFF)
        {
            ++pos;
            continue;
        }
        if (marker == 0xD8)
        {
            pos += 2;
            continue;
        }
        if (marker == 0xD9)
        {
            out.push_back(0xFF);
            out.push_back(0xD9);
            break;
        }
        if (marker == 0xDA)
        {
            // Entropy-coded data follows; keep everything from here on
            out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(pos), data.end());
            break;
        }
        if (isStandaloneMarker(marker))
        {
            out.push_back(0xFF);
            out.push_back(marker);
            pos += 2;
            continue;
        }

        size_t end = 0;
        bool valid = jpegSegmentValid(data, pos, end);
        if (valid && !isAppOrComment(marker))
        {
            out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                       data.begin() + static_cast<std::ptrdiff_t>(end));
            pos = end;
        }
        else if (valid)
        {
            pos = end;
        }
        else
        {
            Logger::debug("Dropping malformed JPEG segment 0xFF" + std::to_string(marker) + " at offset " + std::to_string(pos));
            pos = resyncJpeg(data, pos + 2);
        }
    }
    return out;
}

std::vector<uint8_t> ImageRepair::sanitizePng(const std::vector<uint8_t> &data)
{
    std::vector<uint8_t> out;
    if (!isPng(data))
        return out;

    out.reserve(data.size());
    out.insert(out.end(), kPngSignature, kPngSignature + 8);

    size_t pos = 8;
    size_t palette_entries = 0;
    bool wrote_end = false;
    while (pos + 8 <= data.size())
    {
        uint32_t length = readBE32(&data[pos]);
        std::string type(reinterpret_cast<const char *>(&data[pos + 4]), 4);
        if (pos + 12 + static_cast<size_t>(length) > data.size())
        {
            Logger::debug("PNG chunk " + type + " truncated, stopping at offset " + std::to_string(pos));
            break;
        }

        const uint8_t *payload = &data[pos + 8];
        bool crc_ok = readBE32(payload + length) == pngChunkCrc(type, payload, length);
        bool critical = std::isupper(static_cast<unsigned char>(type[0])) != 0;
        pos += 12 + length;

        if (type == "IEND")
        {
            appendPngChunk(out, type, nullptr, 0);
            wrote_end = true;
            break;
        }
        if (kPngMetadataChunks.count(type) > 0)
            continue;
        if (type == "PLTE")
            palette_entries = length / 3;

        if (type == "tRNS")
        {
            if (!crc_ok)
                continue;
            size_t kept = length;
            if (palette_entries > 0 && kept > palette_entries)
                kept = palette_entries;
            appendPngChunk(out, type, payload, kept);
            continue;
        }

        // Critical chunks cannot be dropped, so their checksum is rebuilt
        if (critical || crc_ok)
            appendPngChunk(out, type, payload, length);
    }

    if (!wrote_end)
        appendPngChunk(out, "IEND", nullptr, 0);
    return out;
}

std::optional<std::vector<uint8_t>> ImageRepair::reencode(const cv::Mat &image, const std::string &file_type)
{
    if (image.empty())
        return std::nullopt;

    try
    {
        std::vector<uint8_t> encoded;
        cv::Mat pixels = image;
        if (pixels.depth() != CV_8U && pixels.depth() != CV_16U)
            pixels.convertTo(pixels, CV_8U, 255.0);

        if (file_type == "jpeg")
        {
            if (pixels.depth() == CV_16U)
                pixels.convertTo(pixels, CV_8U, 1.0 / 257.0);
            if (pixels.channels() == 4)
                cv::cvtColor(pixels, pixels, cv::COLOR_BGRA2BGR);
            std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, 95, cv::IMWRITE_JPEG_OPTIMIZE, 1};
            if (!cv::imencode(".jpg", pixels, encoded, params))
                return std::nullopt;
        }
        else if (file_type == "webp")
        {
            if (pixels.depth() == CV_16U)
                pixels.convertTo(pixels, CV_8U, 1.0 / 257.0);
            // Quality above 100 selects lossless, which keeps alpha intact
            std::vector<int> params = {cv::IMWRITE_WEBP_QUALITY, 101};
            if (!cv::imencode(".webp", pixels, encoded, params))
                return std::nullopt;
        }
        else
        {
            if (!cv::imencode(".png", pixels, encoded))
                return std::nullopt;
        }
        return encoded;
    }
    catch (const cv::Exception &e)
    {
        Logger::debug("Re-encoding repaired image failed: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<std::vector<uint8_t>> ImageRepair::repair(const std::vector<uint8_t> &data, CorruptionKind kind)
{
    std::vector<uint8_t> sanitized;
    std::string format;
    switch (kind)
    {
    case CorruptionKind::JPEG_METADATA:
        sanitized = sanitizeJpeg(data);
        format = "jpeg";
        break;
    case CorruptionKind::PNG_CHUNKS:
        sanitized = sanitizePng(data);
        format = "png";
        break;
    default:
        return std::nullopt;
    }

    if (sanitized.empty())
        return std::nullopt;

    try
    {
        cv::Mat decoded = cv::imdecode(cv::Mat(1, static_cast<int>(sanitized.size()), CV_8UC1, sanitized.data()),
                                       cv::IMREAD_UNCHANGED);
        if (decoded.empty())
        {
            Logger::debug("Sanitised " + format + " still does not decode");
            return std::nullopt;
        }
        return reencode(decoded, format);
    }
    catch (const cv::Exception &e)
    {
        Logger::debug("Decoding sanitised " + format + " failed: " + std::string(e.what()));
        return std::nullopt;
    }
}
