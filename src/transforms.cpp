// transforms.cpp
// Author: Jason Hughes
// Date:   2026
//
// Resample, tensorize, foreground-normalize and clip/rescale stages.

#include "lesion_prep/transforms.hpp"
#include "lesion_prep/parameters.hpp"
#include "lesion_prep/processor_mixins.hpp"

#include <cmath>
#include <sstream>
#include <glog/logging.h>

namespace LesionPrep
{

void checkTensorSample(const Sample& sample, const std::string& stage)
{
    if (!sample.isTensor() || !sample.mask.defined())
        throw ShapeMismatchError(stage + ": expects a tensorized sample.");

    const at::Tensor& image = sample.image;
    const at::Tensor& mask  = sample.mask;
    if (image.dim() != 3 || image.size(0) != 3 || mask.dim() != 2 ||
        image.size(1) != mask.size(0) || image.size(2) != mask.size(1))
    {
        std::ostringstream os;
        os << stage << ": expected image (3, H, W) and mask (H, W), got image "
           << image.sizes() << " and mask " << mask.sizes() << ".";
        throw ShapeMismatchError(os.str());
    }
}

// ---------------------------------------------------------------------------
// Foreground statistics
// ---------------------------------------------------------------------------

ForegroundStats computeForegroundStats(const at::Tensor& image, const at::Tensor& mask)
{
    // Selection and values both come from the same (H, W) plane of channel 0
    at::Tensor values = image.select(0, kReferenceChannel)
                             .masked_select(mask > 0)
                             .to(torch::kFloat64);

    ForegroundStats stats;
    stats.count = values.numel();
    if (stats.count == 0)
        throw DegenerateStatisticsError("ForegroundNormalizer: mask has no foreground pixels.");

    if (values.max().item<double>() == values.min().item<double>())
        throw DegenerateStatisticsError("ForegroundNormalizer: foreground is constant (std = 0).");

    stats.mean   = values.mean().item<double>();
    stats.stddev = std::sqrt((values - stats.mean).pow(2).mean().item<double>());

    if (!std::isfinite(stats.mean) || !std::isfinite(stats.stddev) || stats.stddev <= 0.0)
    {
        std::ostringstream os;
        os << "ForegroundNormalizer: unusable statistics (mean " << stats.mean
           << ", std " << stats.stddev << ").";
        throw DegenerateStatisticsError(os.str());
    }
    return stats;
}

// ---------------------------------------------------------------------------
// GeometricResampler
// ---------------------------------------------------------------------------

GeometricResampler::GeometricResampler(int height, int width)
    : height_(height), width_(width)
{
    if (height_ <= 0 || width_ <= 0)
    {
        std::ostringstream os;
        os << "GeometricResampler: target resolution must be positive, got "
           << height_ << "x" << width_ << ".";
        throw InvalidGeometryError(os.str());
    }
}

Sample GeometricResampler::operator()(const Sample& sample) const
{
    if (sample.isTensor())
        throw InvalidGeometryError("GeometricResampler: expects a spatial sample.");
    if (sample.image_mat.empty() || sample.mask_mat.empty())
        throw InvalidGeometryError("GeometricResampler: empty image or mask.");
    if (sample.image_mat.size() != sample.mask_mat.size())
    {
        std::ostringstream os;
        os << "GeometricResampler: image is " << sample.image_mat.rows << "x" << sample.image_mat.cols
           << " but mask is " << sample.mask_mat.rows << "x" << sample.mask_mat.cols << ".";
        throw InvalidGeometryError(os.str());
    }

    VLOG(1) << "GeometricResampler: " << sample.image_mat.rows << "x" << sample.image_mat.cols
            << " -> " << height_ << "x" << width_;

    return Sample::fromMats(resizeImage(sample.image_mat, height_, width_),
                            resizeMask (sample.mask_mat,  height_, width_));
}

// ---------------------------------------------------------------------------
// Tensorizer
// ---------------------------------------------------------------------------

Sample Tensorizer::operator()(const Sample& sample) const
{
    if (sample.isTensor())
        throw ShapeMismatchError("Tensorizer: sample is already tensorized.");
    if (sample.image_mat.type() != CV_8UC3)
        throw ShapeMismatchError("Tensorizer: image must be 8-bit, 3 channels.");
    if (sample.mask_mat.channels() != 1)
        throw ShapeMismatchError("Tensorizer: mask must be single-channel.");

    at::Tensor image = imageToTensor(sample.image_mat, bgr_input_);  // (3, H, W)
    at::Tensor mask  = maskToTensor(sample.mask_mat);                // (H, W)

    if (image.size(1) != mask.size(0) || image.size(2) != mask.size(1))
    {
        std::ostringstream os;
        os << "Tensorizer: image " << image.sizes() << " does not match mask " << mask.sizes() << ".";
        throw ShapeMismatchError(os.str());
    }
    return Sample::fromTensors(image, mask);
}

// ---------------------------------------------------------------------------
// ForegroundNormalizer
// ---------------------------------------------------------------------------

Sample ForegroundNormalizer::operator()(const Sample& sample) const
{
    checkTensorSample(sample, name());

    ForegroundStats stats = computeForegroundStats(sample.image, sample.mask);
    VLOG(1) << "ForegroundNormalizer: " << stats.count << " pixels, mean "
            << stats.mean << ", std " << stats.stddev;

    // Scalar statistics, applied to every channel
    at::Tensor normalized = (sample.image - stats.mean) / stats.stddev;
    return Sample::fromTensors(normalized, sample.mask);
}

// ---------------------------------------------------------------------------
// RangeClamp
// ---------------------------------------------------------------------------

RangeClamp::RangeClamp(float clip_min, float clip_max, float out_min, float out_max)
    : clip_min_(clip_min), clip_max_(clip_max), out_min_(out_min), out_max_(out_max)
{
    validateRange(clip_min_, clip_max_, "RangeClamp: clip_range");
    validateRange(out_min_,  out_max_,  "RangeClamp: output_range");
}

Sample RangeClamp::operator()(const Sample& sample) const
{
    checkTensorSample(sample, name());

    at::Tensor clipped  = torch::clamp(sample.image, clip_min_, clip_max_);
    at::Tensor rescaled = (clipped - clip_min_) / (clip_max_ - clip_min_)
                          * (out_max_ - out_min_) + out_min_;
    // Keep float rounding inside the output interval
    rescaled = torch::clamp(rescaled, out_min_, out_max_);

    // (H, W) -> (3, H, W); must run after the rescale
    at::Tensor background = (sample.mask == 0).unsqueeze(0).expand_as(rescaled);
    at::Tensor result = rescaled.masked_fill(background, 0.0);

    return Sample::fromTensors(result, sample.mask);
}

}  // namespace LesionPrep
