#include "core/image_info_extractor.hpp"
#include "core/file_type_sniffer.hpp"
#include "core/image_repair.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>

std::atomic<uint64_t> ImageInfoExtractor::decode_attempts_{0};
std::atomic<uint64_t> ImageInfoExtractor::repair_attempts_{0};

ImageRecord ImageInfoExtractor::extractInfo(const std::vector<uint8_t> &data)
{
    ImageRecord record;
    record.size_bytes = data.size();
    record.content_hash = computeContentHash(data);

    if (extractImageFields(data, record))
    {
        return record;
    }

    CorruptionKind kind = ImageRepair::detectCorruption(data);
    if (kind == CorruptionKind::NONE)
    {
        Logger::debug("Content " + record.content_hash + " does not decode as an image");
        return record;
    }

    repair_attempts_++;
    Logger::info("Attempting repair of corrupted image " + record.content_hash);
    auto repaired = ImageRepair::repair(data, kind);
    if (!repaired)
    {
        Logger::warn("Repair failed for " + record.content_hash);
        return record;
    }

    // The repaired copy only provides image fields; size and hash stay those of the input
    ImageRecord repaired_fields;
    if (!extractImageFields(*repaired, repaired_fields))
    {
        Logger::warn("Repaired copy of " + record.content_hash + " still does not decode");
        return record;
    }

    record.perceptual_hash = repaired_fields.perceptual_hash;
    record.file_type = repaired_fields.file_type;
    record.width = repaired_fields.width;
    record.height = repaired_fields.height;
    record.orientation = repaired_fields.orientation;
    record.repaired = true;
    Logger::info("Repaired image " + record.content_hash + " (" + std::to_string(record.width) + "x" + std::to_string(record.height) + ")");
    return record;
}

bool ImageInfoExtractor::extractImageFields(const std::vector<uint8_t> &data, ImageRecord &record)
{
    try
    {
        cv::Mat image = decode(data);
        if (image.empty())
        {
            return false;
        }

        std::string phash = computePerceptualHash(image);
        if (phash.empty())
        {
            return false;
        }

        record.perceptual_hash = phash;
        record.width = static_cast<uint32_t>(image.cols);
        record.height = static_cast<uint32_t>(image.rows);
        record.orientation = orientationFor(record.width, record.height);
        record.file_type = decoderFormat(data);
        return true;
    }
    catch (const cv::Exception &e)
    {
        Logger::debug("OpenCV error while extracting image fields: " + std::string(e.what()));
        return false;
    }
    catch (const std::exception &e)
    {
        Logger::debug("Error while extracting image fields: " + std::string(e.what()));
        return false;
    }
}

cv::Mat ImageInfoExtractor::decode(const std::vector<uint8_t> &data)
{
    decode_attempts_++;
    if (data.empty())
    {
        return cv::Mat();
    }
    cv::Mat raw(1, static_cast<int>(data.size()), CV_8UC1, const_cast<uint8_t *>(data.data()));
    return cv::imdecode(raw, cv::IMREAD_UNCHANGED);
}

std::string ImageInfoExtractor::decoderFormat(const std::vector<uint8_t> &data)
{
    auto sniffed = FileTypeSniffer::identifyType(data);
    if (sniffed && FileTypeSniffer::isRasterImageType(*sniffed))
    {
        return *sniffed;
    }
    if (data.size() >= 2 && data[0] == 'P' && data[1] >= '1' && data[1] <= '7')
    {
        return "pnm";
    }
    if (data.size() >= 10 && std::memcmp(data.data(), "#?RADIANCE", 10) == 0)
    {
        return "hdr";
    }
    return sniffed.value_or("");
}

cv::Mat ImageInfoExtractor::toHashableGray(const cv::Mat &image)
{
    cv::Mat eight_bit;
    switch (image.depth())
    {
    case CV_8U:
        eight_bit = image;
        break;
    case CV_16U:
        image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
        break;
    case CV_32F:
    case CV_64F:
        image.convertTo(eight_bit, CV_8U, 255.0);
        break;
    default:
        image.convertTo(eight_bit, CV_8U);
        break;
    }

    cv::Mat gray;
    switch (eight_bit.channels())
    {
    case 1:
        gray = eight_bit;
        break;
    case 3:
        cv::cvtColor(eight_bit, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(eight_bit, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
    {
        std::vector<cv::Mat> planes;
        cv::split(eight_bit, planes);
        gray = planes.front();
        break;
    }
    }
    return gray;
}

std::string ImageInfoExtractor::computePerceptualHash(const cv::Mat &image)
{
    if (image.empty())
    {
        return "";
    }

    cv::Mat gray = toHashableGray(image);

    // Resize to 32x32 for pHash (perceptual hash)
    cv::Mat resized_image;
    cv::resize(gray, resized_image, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized_image.convertTo(float_image, CV_64F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    // OpenCV's DCT is orthonormal; scale the first row and column so the
    // coefficients are proportional to the unnormalised DCT-II on both axes
    cv::Mat dct_8x8 = dct_image(cv::Rect(0, 0, 8, 8)).clone();
    const double root_two = std::sqrt(2.0);
    dct_8x8.row(0) *= root_two;
    dct_8x8.col(0) *= root_two;

    std::vector<double> dct_values;
    dct_values.reserve(64);
    for (int y = 0; y < 8; ++y)
    {
        for (int x = 0; x < 8; ++x)
        {
            dct_values.push_back(dct_8x8.at<double>(y, x));
        }
    }

    std::vector<double> sorted = dct_values;
    std::sort(sorted.begin(), sorted.end());
    double median = (sorted[31] + sorted[32]) / 2.0;

    uint64_t bits = 0;
    for (double value : dct_values)
    {
        bits = (bits << 1) | (value > median ? 1u : 0u);
    }

    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setw(16) << std::setfill('0') << bits;
    return ss.str();
}

std::string ImageInfoExtractor::computeContentHash(const std::vector<uint8_t> &data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_md5(), nullptr) != 1)
    {
        Logger::error("MD5 computation failed");
        return "";
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_length; ++i)
        ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}

uint64_t ImageInfoExtractor::decodeAttemptCount()
{
    return decode_attempts_.load();
}

uint64_t ImageInfoExtractor::repairAttemptCount()
{
    return repair_attempts_.load();
}

void ImageInfoExtractor::resetCounters()
{
    decode_attempts_ = 0;
    repair_attempts_ = 0;
}
