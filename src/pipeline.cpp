// pipeline.cpp
// Author: Jason Hughes
// Date:   2026
//
// Stage assembly and execution for the preprocessing pipeline.

#include "lesion_prep/pipeline.hpp"

#include <glog/logging.h>

namespace LesionPrep
{

PreprocessingPipeline::PreprocessingPipeline()
{
    buildStages();
}

PreprocessingPipeline::PreprocessingPipeline(const PipelineParameters& params)
    : params_(params)
{
    buildStages();
}

PreprocessingPipeline::PreprocessingPipeline(const std::string& yaml_path)
    : params_(yaml_path)
{
    buildStages();
}

// ---------------------------------------------------------------------------

void PreprocessingPipeline::buildStages()
{
    // Fields may have been edited after construction of params_
    params_.validate();

    // Order matters: statistics and re-zeroing need the mask at the
    // resampled geometry.
    stages_.clear();
    stages_.push_back(std::make_unique<GeometricResampler>(params_.target_height, params_.target_width));
    stages_.push_back(std::make_unique<Tensorizer>(params_.bgr_input));
    stages_.push_back(std::make_unique<ForegroundNormalizer>());
    stages_.push_back(std::make_unique<RangeClamp>(params_.clip_min, params_.clip_max,
                                                   params_.out_min,  params_.out_max));

    LOG(INFO) << "PreprocessingPipeline: " << params_.toString();
}

Sample PreprocessingPipeline::process(const Sample& sample) const
{
    Sample current = sample;
    for (const auto& stage : stages_)
    {
        current = (*stage)(current);
        VLOG(1) << stage->name() << ": " << current.describe();
    }
    return current;
}

std::vector<std::string> PreprocessingPipeline::stageNames() const
{
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_)
        names.push_back(stage->name());
    return names;
}

}  // namespace LesionPrep
