// sample_io.hpp
// Author: Jason Hughes
// Date:   2026
//
// Reads one explicitly named image / mask pair from disk.

#pragma once

#include <string>

#include "lesion_prep/sample.hpp"

namespace LesionPrep
{

/// Colour image (BGR, CV_8UC3) and greyscale mask (CV_8UC1) as a spatial Sample.
/// Throws std::runtime_error if either file cannot be read.
Sample readSample(const std::string& image_path, const std::string& mask_path);

}  // namespace LesionPrep
