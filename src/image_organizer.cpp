#include "core/image_organizer.hpp"
#include "core/file_type_sniffer.hpp"
#include "core/file_utils.hpp"
#include "core/image_info_extractor.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace
{
    // Extensions classifyByOrientation looks at
    const std::unordered_set<std::string> kClassifiableExtensions = {
        "png", "jpg", "jpeg", "gif", "bmp", "webp", "avif"};
}

std::optional<std::string> ImageOrganizer::correctFileExtension(const std::string &file_path, const std::string &target_dir)
{
    auto content = FileUtils::readFileBytes(file_path);
    if (!content)
    {
        Logger::error("Cannot correct extension, unreadable file: " + file_path);
        return std::nullopt;
    }

    ImageRecord record = ImageInfoExtractor::extractInfo(*content);
    size_t sniff_length = std::min(content->size(), FileTypeSniffer::kSniffLength);
    std::string file_type = FileTypeSniffer::identifyType(content->data(), sniff_length).value_or(record.file_type);
    if (file_type.empty())
    {
        Logger::warn("Unrecognized file type, leaving as is: " + file_path);
        return std::nullopt;
    }

    fs::path destination_dir = target_dir.empty() ? fs::path(file_path).parent_path() : fs::path(target_dir);
    fs::path new_path = destination_dir / (record.content_hash + FileTypeSniffer::extensionFor(file_type));
    if (new_path == fs::path(file_path))
    {
        return std::nullopt;
    }

    std::error_code ec;
    if (!destination_dir.empty())
    {
        fs::create_directories(destination_dir, ec);
        if (ec)
        {
            Logger::error("Cannot create directory " + destination_dir.string() + ": " + ec.message());
            return std::nullopt;
        }
    }
    if (!moveFile(file_path, new_path.string()))
    {
        return std::nullopt;
    }
    return new_path.string();
}

size_t ImageOrganizer::batchCorrectExtensions(const std::string &directory, const std::string &target_dir)
{
    size_t renamed = 0;
    for (const auto &path : FileUtils::listFiles(directory, false))
    {
        if (correctFileExtension(path, target_dir))
            renamed++;
    }
    Logger::info("Corrected extensions of " + std::to_string(renamed) + " files in " + directory);
    return renamed;
}

std::vector<ImageFileInfo> ImageOrganizer::filterImagesBySize(const std::string &directory,
                                                              uint32_t min_width, uint32_t min_height,
                                                              uint32_t max_width, uint32_t max_height)
{
    std::vector<ImageFileInfo> matches;
    for (const auto &path : FileUtils::listFiles(directory, false))
    {
        auto content = FileUtils::readFileBytes(path);
        if (!content)
            continue;

        ImageRecord record = ImageInfoExtractor::extractInfo(*content);
        if (!record.isDecodedImage())
            continue;
        if (record.width >= min_width && record.width <= max_width &&
            record.height >= min_height && record.height <= max_height)
        {
            matches.push_back({path, record});
        }
    }
    return matches;
}

OrientationCounts ImageOrganizer::classifyByOrientation(const std::string &source_dir,
                                                        const std::string &horizontal_dir,
                                                        const std::string &vertical_dir)
{
    OrientationCounts counts;
    fs::path horizontal = horizontal_dir.empty() ? fs::path(source_dir) / "horizontal" : fs::path(horizontal_dir);
    fs::path vertical = vertical_dir.empty() ? fs::path(source_dir) / "vertical" : fs::path(vertical_dir);

    std::error_code ec;
    fs::create_directories(horizontal, ec);
    if (!ec)
        fs::create_directories(vertical, ec);
    if (ec)
    {
        Logger::error("Cannot create orientation directories: " + ec.message());
        return counts;
    }

    for (const auto &path : FileUtils::listFiles(source_dir, false))
    {
        if (kClassifiableExtensions.count(FileUtils::lowercaseExtension(path)) == 0)
            continue;

        auto content = FileUtils::readFileBytes(path);
        ImageRecord record = content ? ImageInfoExtractor::extractInfo(*content) : ImageRecord();
        if (record.orientation == ImageOrientation::UNKNOWN)
        {
            Logger::warn("Cannot determine orientation of " + path);
            counts.skipped++;
            continue;
        }

        fs::path destination = (record.orientation == ImageOrientation::HORIZONTAL ? horizontal : vertical) /
                               fs::path(path).filename();
        fs::copy_file(path, destination, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            Logger::error("Failed to copy " + path + " to " + destination.string() + ": " + ec.message());
            counts.skipped++;
            continue;
        }

        if (record.orientation == ImageOrientation::HORIZONTAL)
            counts.horizontal++;
        else
            counts.vertical++;
        Logger::debug("Classified " + path + " as " + orientationName(record.orientation));
    }

    Logger::info("Classified " + source_dir + ": " + std::to_string(counts.horizontal) + " horizontal, " +
                 std::to_string(counts.vertical) + " vertical");
    return counts;
}

std::vector<std::string> ImageOrganizer::splitImageByGrid(const std::string &image_path, int rows, int cols,
                                                          const std::string &output_dir, const std::string &prefix)
{
    std::vector<std::string> outputs;
    if (rows <= 0 || cols <= 0)
    {
        Logger::error("Grid must have at least one row and one column");
        return outputs;
    }

    try
    {
        cv::Mat image = cv::imread(image_path, cv::IMREAD_UNCHANGED);
        if (image.empty())
        {
            Logger::error("Failed to load image: " + image_path);
            return outputs;
        }

        int cell_width = image.cols / cols;
        int cell_height = image.rows / rows;
        if (cell_width == 0 || cell_height == 0)
        {
            Logger::error("Image " + image_path + " is too small for a " + std::to_string(rows) + "x" + std::to_string(cols) + " grid");
            return outputs;
        }

        std::error_code ec;
        fs::create_directories(output_dir, ec);
        if (ec)
        {
            Logger::error("Cannot create output directory " + output_dir + ": " + ec.message());
            return outputs;
        }

        for (int row = 0; row < rows; ++row)
        {
            for (int col = 0; col < cols; ++col)
            {
                cv::Mat cell = image(cv::Rect(col * cell_width, row * cell_height, cell_width, cell_height));
                std::ostringstream name;
                name << prefix << "_" << std::setw(2) << std::setfill('0') << (row * cols + col + 1) << ".png";
                std::string output_path = (fs::path(output_dir) / name.str()).string();
                if (!cv::imwrite(output_path, cell))
                {
                    Logger::error("Failed to write grid cell " + output_path);
                    return {};
                }
                outputs.push_back(output_path);
            }
        }
    }
    catch (const cv::Exception &e)
    {
        Logger::error("Error splitting " + image_path + ": " + std::string(e.what()));
        return {};
    }

    Logger::info("Split " + image_path + " into " + std::to_string(outputs.size()) + " cells");
    return outputs;
}

bool ImageOrganizer::moveFile(const std::string &src, const std::string &dst)
{
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec)
    {
        Logger::info("Moved " + src + " -> " + dst);
        return true;
    }

    // rename fails across filesystems; fall back to copy and delete
    std::error_code copy_ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, copy_ec);
    if (copy_ec)
    {
        Logger::error("Move failed: " + src + " -> " + dst + ": " + copy_ec.message());
        return false;
    }
    fs::remove(src, copy_ec);
    if (copy_ec)
    {
        Logger::warn("Copied " + src + " to " + dst + " but could not remove the source: " + copy_ec.message());
    }
    Logger::info("Moved " + src + " -> " + dst);
    return true;
}
