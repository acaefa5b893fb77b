#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "core/image_record.hpp"

/**
 * @brief An image file together with its extracted metadata
 */
struct ImageFileInfo
{
    std::string file_path;
    ImageRecord record;
};

struct OrientationCounts
{
    size_t horizontal;
    size_t vertical;
    size_t skipped; // Not decodable or failed to copy

    OrientationCounts() : horizontal(0), vertical(0), skipped(0) {}
};

/**
 * @brief File housekeeping for downloaded image collections
 *
 * All operations work on the regular files directly inside a directory and
 * isolate failures per file.
 */
class ImageOrganizer
{
public:
    /**
     * @brief Rename a file to {MD5}{extension of its detected type}
     *
     * The type comes from the signature table, falling back to the decoder
     * format. Files of unknown type are left in place.
     * @param target_dir Destination directory, the file's own directory when empty
     * @return The new path, or std::nullopt when the file was not renamed
     */
    static std::optional<std::string> correctFileExtension(const std::string &file_path, const std::string &target_dir = "");

    // Applies correctFileExtension to every file; returns how many were renamed
    static size_t batchCorrectExtensions(const std::string &directory, const std::string &target_dir = "");

    /**
     * @brief Decodable images whose dimensions fall inside the inclusive bounds
     */
    static std::vector<ImageFileInfo> filterImagesBySize(const std::string &directory,
                                                         uint32_t min_width = 0, uint32_t min_height = 0,
                                                         uint32_t max_width = std::numeric_limits<uint32_t>::max(),
                                                         uint32_t max_height = std::numeric_limits<uint32_t>::max());

    /**
     * @brief Copy images into horizontal and vertical subsets
     *
     * Destinations default to "horizontal" and "vertical" inside source_dir.
     */
    static OrientationCounts classifyByOrientation(const std::string &source_dir,
                                                   const std::string &horizontal_dir = "",
                                                   const std::string &vertical_dir = "");

    /**
     * @brief Cut an image into rows x cols equal cells saved as {prefix}_{NN}.png
     *
     * Cells are numbered from 01 in row-major order. Remainder pixels on the
     * right and bottom edges are discarded.
     * @return Paths of the written cells, empty on failure
     */
    static std::vector<std::string> splitImageByGrid(const std::string &image_path, int rows, int cols,
                                                     const std::string &output_dir, const std::string &prefix = "split");

    static bool moveFile(const std::string &src, const std::string &dst);
};
