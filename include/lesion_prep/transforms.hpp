// transforms.hpp
// Author: Jason Hughes
// Date:   2026
//
// The four preprocessing stages. Each maps a Sample to a new Sample and
// throws a PreprocessError subclass when the input cannot be processed.

#pragma once

#include <string>
#include <torch/torch.h>

#include "lesion_prep/sample.hpp"
#include "lesion_prep/errors.hpp"

namespace LesionPrep
{

// ---------------------------------------------------------------------------
// Stage interface
// ---------------------------------------------------------------------------

class Transform
{
public:
    virtual ~Transform() = default;

    /// Returns a new Sample; the input is never modified.
    virtual Sample operator()(const Sample& sample) const = 0;

    virtual std::string name() const = 0;
};

// ---------------------------------------------------------------------------
// Foreground statistics
// ---------------------------------------------------------------------------

/// Channel the statistics are taken from (red, after tensorization).
constexpr int64_t kReferenceChannel = 0;

struct ForegroundStats
{
    double  mean;
    double  stddev; ///< population standard deviation
    int64_t count;  ///< number of foreground pixels
};

/// Mean and population std of image[kReferenceChannel] where mask > 0.
///
/// @param image  (3, H, W) float tensor
/// @param mask   (H, W) label tensor
/// @throws DegenerateStatisticsError if no pixel is foreground or std is 0
ForegroundStats computeForegroundStats(const at::Tensor& image, const at::Tensor& mask);

// ---------------------------------------------------------------------------
// Stages
// ---------------------------------------------------------------------------

/// Resizes image (bilinear) and mask (nearest) to a fixed resolution.
class GeometricResampler : public Transform
{
public:
    GeometricResampler(int height, int width);

    Sample operator()(const Sample& sample) const override;
    std::string name() const override { return "GeometricResampler"; }

private:
    int height_;
    int width_;
};

/// Spatial Mats -> (3, H, W) image in [0, 1] and (H, W) mask.
class Tensorizer : public Transform
{
public:
    explicit Tensorizer(bool bgr_input = true) : bgr_input_(bgr_input) {}

    Sample operator()(const Sample& sample) const override;
    std::string name() const override { return "Tensorizer"; }

private:
    bool bgr_input_;
};

/// Z-score of the whole image using foreground-only statistics.
class ForegroundNormalizer : public Transform
{
public:
    Sample operator()(const Sample& sample) const override;
    std::string name() const override { return "ForegroundNormalizer"; }
};

/// Clip, rescale onto the output range, then zero the background.
class RangeClamp : public Transform
{
public:
    RangeClamp(float clip_min = -5.0f, float clip_max = 5.0f,
               float out_min  =  0.0f, float out_max  = 1.0f);

    Sample operator()(const Sample& sample) const override;
    std::string name() const override { return "RangeClamp"; }

private:
    float clip_min_;
    float clip_max_;
    float out_min_;
    float out_max_;
};

/// Throws ShapeMismatchError unless image is (3, H, W) and mask is (H, W).
void checkTensorSample(const Sample& sample, const std::string& stage);

}  // namespace LesionPrep
