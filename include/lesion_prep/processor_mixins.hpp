// processor_mixins.hpp
// Author: Jason Hughes
// Date:   2026
//
// Low-level image manipulation helpers shared by the preprocessing stages.

#pragma once

#include <opencv2/opencv.hpp>
#include <torch/torch.h>

namespace LesionPrep
{

/// Resize an image to (width, height) using bilinear interpolation.
cv::Mat resizeImage(const cv::Mat& image, int height, int width);

/// Resize a label mask to (width, height) using nearest-neighbour
/// interpolation, so no new label values are introduced.
cv::Mat resizeMask(const cv::Mat& mask, int height, int width);

/// Convert an HxWx3 uint8 OpenCV image to a (3, H, W) float32 tensor in [0, 1].
///
/// @param image      Input CV_8UC3 image
/// @param bgr_input  Swap BGR -> RGB so channel 0 is red
at::Tensor imageToTensor(const cv::Mat& image, bool bgr_input);

/// Convert a single-channel HxW OpenCV mask to an (H, W) float32 tensor.
/// Label values are copied as-is, not rescaled.
at::Tensor maskToTensor(const cv::Mat& mask);

}  // namespace LesionPrep
