// errors.hpp
// Author: Jason Hughes
// Date:   2026
//
// Exception types raised by the preprocessing stages.

#pragma once

#include <stdexcept>
#include <string>

namespace LesionPrep
{

/// Base class for every failure raised while preparing a sample.
class PreprocessError : public std::runtime_error
{
public:
    explicit PreprocessError(const std::string& what) : std::runtime_error(what) {}
};

/// Non-positive target resolution, or empty / mismatched input geometry.
class InvalidGeometryError : public PreprocessError
{
public:
    explicit InvalidGeometryError(const std::string& what) : PreprocessError(what) {}
};

/// Image and mask disagree on shape, or a stage got the wrong layout.
class ShapeMismatchError : public PreprocessError
{
public:
    explicit ShapeMismatchError(const std::string& what) : PreprocessError(what) {}
};

/// Empty foreground or zero-variance foreground.
class DegenerateStatisticsError : public PreprocessError
{
public:
    explicit DegenerateStatisticsError(const std::string& what) : PreprocessError(what) {}
};

/// Malformed clip or output range.
class InvalidRangeError : public PreprocessError
{
public:
    explicit InvalidRangeError(const std::string& what) : PreprocessError(what) {}
};

}  // namespace LesionPrep
