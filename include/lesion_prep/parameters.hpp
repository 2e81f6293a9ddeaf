// parameters.hpp
// Author: Jason Hughes
// Date:   2026
//
// Construction-time configuration of the preprocessing pipeline.

#pragma once

#include <string>

namespace LesionPrep
{

struct PipelineParameters
{
    int   target_height = 128;   ///< Resampled height
    int   target_width  = 128;   ///< Resampled width
    float clip_min      = -5.0f; ///< Lower clip bound on z-scores
    float clip_max      =  5.0f; ///< Upper clip bound on z-scores
    float out_min       =  0.0f; ///< Value clip_min is mapped to
    float out_max       =  1.0f; ///< Value clip_max is mapped to
    bool  bgr_input     = true;  ///< Raw images arrive in OpenCV BGR order

    /// Defaults: 128x128, clip [-5, 5], output [0, 1].
    PipelineParameters();

    PipelineParameters(int height, int width,
                       float clip_lo, float clip_hi,
                       float out_lo,  float out_hi,
                       bool bgr = true);

    /// Load from a YAML file. Missing keys keep their defaults.
    ///
    /// target_resolution: [128, 128]
    /// clip_range:        [-5.0, 5.0]
    /// output_range:      [0.0, 1.0]
    /// bgr_input:         true
    explicit PipelineParameters(const std::string& yaml_path);

    /// Throws InvalidGeometryError or InvalidRangeError.
    void validate() const;

    std::string toString() const;
};

/// Throws InvalidRangeError unless lo < hi and both are finite.
void validateRange(float lo, float hi, const std::string& what);

}  // namespace LesionPrep
