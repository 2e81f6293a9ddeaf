// pipeline.hpp
// Author: Jason Hughes
// Date:   2026
//
// Fixed-order preprocessing pipeline:
//   GeometricResampler -> Tensorizer -> ForegroundNormalizer -> RangeClamp

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lesion_prep/parameters.hpp"
#include "lesion_prep/sample.hpp"
#include "lesion_prep/transforms.hpp"

namespace LesionPrep
{

class PreprocessingPipeline
{
public:
    /// Defaults: 128x128, clip [-5, 5], output [0, 1].
    PreprocessingPipeline();

    explicit PreprocessingPipeline(const PipelineParameters& params);

    /// @param yaml_path  Path to lesion_prep.yaml
    explicit PreprocessingPipeline(const std::string& yaml_path);

    /// Run every stage in order. The first stage error propagates unchanged.
    ///
    /// @param sample  Spatial sample: CV_8UC3 image and single-channel mask
    /// @returns       image (3, H, W) in [out_min, out_max] with background 0,
    ///                mask (H, W) at the target resolution
    Sample process(const Sample& sample) const;

    Sample operator()(const Sample& sample) const { return process(sample); }

    std::vector<std::string> stageNames() const;

    const PipelineParameters& params() const { return params_; }

private:
    void buildStages();

    PipelineParameters                      params_;
    std::vector<std::unique_ptr<Transform>> stages_;
};

}  // namespace LesionPrep
