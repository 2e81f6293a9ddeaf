// parameters.cpp
// Author: Jason Hughes
// Date:   2026
//
// PipelineParameters loading and validation.

#include "lesion_prep/parameters.hpp"
#include "lesion_prep/errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace LesionPrep
{

namespace
{

/// Reads a two-element sequence such as [min, max]; leaves a, b alone if absent.
template <typename T>
void readPair(const YAML::Node& cfg, const std::string& key, T& a, T& b)
{
    YAML::Node node = cfg[key];
    if (!node)
        return;
    if (!node.IsSequence() || node.size() != 2)
        throw std::runtime_error("PipelineParameters: '" + key + "' must be a two-element list.");
    a = node[0].as<T>();
    b = node[1].as<T>();
}

}  // namespace

void validateRange(float lo, float hi, const std::string& what)
{
    if (!std::isfinite(lo) || !std::isfinite(hi))
        throw InvalidRangeError(what + ": bounds must be finite.");
    if (lo >= hi)
    {
        std::ostringstream os;
        os << what << ": min (" << lo << ") must be below max (" << hi << ").";
        throw InvalidRangeError(os.str());
    }
}

// ---------------------------------------------------------------------------

PipelineParameters::PipelineParameters()
{
    validate();
}

PipelineParameters::PipelineParameters(int height, int width,
                                       float clip_lo, float clip_hi,
                                       float out_lo,  float out_hi,
                                       bool bgr)
    : target_height(height), target_width(width),
      clip_min(clip_lo), clip_max(clip_hi),
      out_min(out_lo), out_max(out_hi),
      bgr_input(bgr)
{
    validate();
}

PipelineParameters::PipelineParameters(const std::string& yaml_path)
{
    YAML::Node cfg;
    try
    {
        cfg = YAML::LoadFile(yaml_path);
    }
    catch (const YAML::BadFile& e)
    {
        throw std::runtime_error("PipelineParameters: cannot open " + yaml_path);
    }
    catch (const YAML::ParserException& e)
    {
        throw std::runtime_error("PipelineParameters: cannot parse " + yaml_path + "\n" + e.what());
    }

    try
    {
        readPair(cfg, "target_resolution", target_height, target_width);
        readPair(cfg, "clip_range",        clip_min,      clip_max);
        readPair(cfg, "output_range",      out_min,       out_max);
        bgr_input = cfg["bgr_input"].as<bool>(true);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("PipelineParameters: bad value in " + yaml_path + "\n" + e.what());
    }

    validate();
}

void PipelineParameters::validate() const
{
    if (target_height <= 0 || target_width <= 0)
    {
        std::ostringstream os;
        os << "PipelineParameters: target resolution must be positive, got "
           << target_height << "x" << target_width << ".";
        throw InvalidGeometryError(os.str());
    }
    validateRange(clip_min, clip_max, "PipelineParameters: clip_range");
    validateRange(out_min,  out_max,  "PipelineParameters: output_range");
}

std::string PipelineParameters::toString() const
{
    std::ostringstream os;
    os << "target " << target_height << "x" << target_width
       << ", clip [" << clip_min << ", " << clip_max << "]"
       << ", output [" << out_min << ", " << out_max << "]"
       << (bgr_input ? ", BGR input" : ", RGB input");
    return os.str();
}

}  // namespace LesionPrep
