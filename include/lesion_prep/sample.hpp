// sample.hpp
// Author: Jason Hughes
// Date:   2026
//
// Paired image / mask unit that flows through the preprocessing stages.

#pragma once

#include <string>
#include <opencv2/opencv.hpp>
#include <torch/torch.h>

namespace LesionPrep
{

/// A Sample is either spatial (OpenCV Mats, before tensorization) or
/// tensor (torch Tensors, after tensorization). Exactly one pair is set.
struct Sample
{
    cv::Mat    image_mat;  ///< H x W, CV_8UC3
    cv::Mat    mask_mat;   ///< H x W, single channel labels

    at::Tensor image;      ///< (3, H, W) float32
    at::Tensor mask;       ///< (H, W) float32 labels, > 0 is foreground

    static Sample fromMats(const cv::Mat& image, const cv::Mat& mask);
    static Sample fromTensors(const at::Tensor& image, const at::Tensor& mask);

    bool isTensor() const { return image.defined(); }

    /// Spatial extent of the image in either layout.
    int height() const;
    int width()  const;

    /// "(3, 128, 128) / (128, 128)" style description for logging.
    std::string describe() const;
};

}  // namespace LesionPrep
