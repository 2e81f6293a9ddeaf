// processor_mixins.cpp
// Author: Jason Hughes
// Date:   2026
//
// Low-level image manipulation helpers for the preprocessing stages.

#include "lesion_prep/processor_mixins.hpp"

namespace LesionPrep
{

cv::Mat resizeImage(const cv::Mat& image, int height, int width)
{
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height),
               0, 0, cv::INTER_LINEAR);
    return resized;
}

cv::Mat resizeMask(const cv::Mat& mask, int height, int width)
{
    cv::Mat resized;
    cv::resize(mask, resized, cv::Size(width, height),
               0, 0, cv::INTER_NEAREST);
    return resized;
}

at::Tensor imageToTensor(const cv::Mat& image, bool bgr_input)
{
    cv::Mat rgb;
    if (bgr_input)
        cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
    else
        rgb = image;
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);   // always a fresh, continuous Mat

    // Wrap as tensor (H, W, C); clone so the tensor owns its storage
    auto tensor = torch::from_blob(
        rgb.data,
        {rgb.rows, rgb.cols, rgb.channels()},
        torch::kFloat32
    ).clone();

    // (H, W, C) -> (C, H, W)
    return tensor.permute({2, 0, 1}).contiguous();
}

at::Tensor maskToTensor(const cv::Mat& mask)
{
    cv::Mat labels;
    mask.convertTo(labels, CV_32FC1);

    // (H, W); no channel dimension
    return torch::from_blob(
        labels.data,
        {labels.rows, labels.cols},
        torch::kFloat32
    ).clone();
}

}  // namespace LesionPrep
