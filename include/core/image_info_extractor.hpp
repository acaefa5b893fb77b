#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/image_record.hpp"

/**
 * @brief Computes content hash, dimensions and perceptual hash of raw bytes
 *
 * Decoding goes through OpenCV. When a buffer fails to decode and carries a
 * known corruption pattern, the extractor repairs it once and runs the
 * extraction again on the repaired bytes without a second repair.
 */
class ImageInfoExtractor
{
public:
    /**
     * @brief Build an ImageRecord for a buffer
     *
     * Never throws. size_bytes and content_hash are always set; the image
     * fields stay empty when the content cannot be decoded even after repair.
     */
    static ImageRecord extractInfo(const std::vector<uint8_t> &data);

    /**
     * @brief Uppercase hex MD5 of the buffer
     */
    static std::string computeContentHash(const std::vector<uint8_t> &data);

    /**
     * @brief 64-bit DCT perceptual hash as 16 uppercase hex characters
     * @param image Decoded image of any depth and channel count
     * @return Hash string, empty when the image is empty
     */
    static std::string computePerceptualHash(const cv::Mat &image);

    /**
     * @brief Decode a buffer keeping its native depth and channels
     * @return Empty Mat when OpenCV cannot decode it
     */
    static cv::Mat decode(const std::vector<uint8_t> &data);

    /**
     * @brief Format tag of a buffer that OpenCV has decoded
     *
     * Raster types come from the signature table; portable anymaps and
     * Radiance files, which the table does not list, are tagged "pnm" and "hdr".
     */
    static std::string decoderFormat(const std::vector<uint8_t> &data);

    // Process-wide counters, mainly for cache verification
    static uint64_t decodeAttemptCount();
    static uint64_t repairAttemptCount();
    static void resetCounters();

private:
    // Fills the image fields of record; returns false when decoding fails
    static bool extractImageFields(const std::vector<uint8_t> &data, ImageRecord &record);

    static cv::Mat toHashableGray(const cv::Mat &image);

    static std::atomic<uint64_t> decode_attempts_;
    static std::atomic<uint64_t> repair_attempts_;
};
