// sample.cpp
// Author: Jason Hughes
// Date:   2026
//
// Sample construction and shape helpers.

#include "lesion_prep/sample.hpp"

#include <sstream>

namespace LesionPrep
{

Sample Sample::fromMats(const cv::Mat& image, const cv::Mat& mask)
{
    Sample s;
    s.image_mat = image;
    s.mask_mat  = mask;
    return s;
}

Sample Sample::fromTensors(const at::Tensor& image, const at::Tensor& mask)
{
    Sample s;
    s.image = image;
    s.mask  = mask;
    return s;
}

int Sample::height() const
{
    if (isTensor())
        return image.dim() >= 2 ? static_cast<int>(image.size(-2)) : 0;
    return image_mat.rows;
}

int Sample::width() const
{
    if (isTensor())
        return image.dim() >= 2 ? static_cast<int>(image.size(-1)) : 0;
    return image_mat.cols;
}

std::string Sample::describe() const
{
    std::ostringstream os;
    if (isTensor())
    {
        os << "image " << image.sizes() << " / mask ";
        if (mask.defined())
            os << mask.sizes();
        else
            os << "[]";
    }
    else
    {
        os << "image " << image_mat.rows << "x" << image_mat.cols
           << "x" << image_mat.channels()
           << " / mask " << mask_mat.rows << "x" << mask_mat.cols
           << "x" << mask_mat.channels();
    }
    return os.str();
}

}  // namespace LesionPrep
