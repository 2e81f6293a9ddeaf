// sample_io.cpp
// Author: Jason Hughes
// Date:   2026
//
// Loading of explicitly named image / mask pairs from disk.

#include "lesion_prep/sample_io.hpp"

#include <filesystem>
#include <stdexcept>

namespace LesionPrep
{

namespace
{

cv::Mat readOrThrow(const std::string& path, int flags)
{
    if (!std::filesystem::exists(path))
        throw std::runtime_error("readSample: file not found: " + path);

    cv::Mat mat = cv::imread(path, flags);
    if (mat.empty())
        throw std::runtime_error("readSample: could not decode " + path);
    return mat;
}

}  // namespace

Sample readSample(const std::string& image_path, const std::string& mask_path)
{
    // IMREAD_COLOR drops alpha and expands grey to 3 channels
    cv::Mat image = readOrThrow(image_path, cv::IMREAD_COLOR);
    cv::Mat mask  = readOrThrow(mask_path,  cv::IMREAD_GRAYSCALE);
    return Sample::fromMats(image, mask);
}

}  // namespace LesionPrep
