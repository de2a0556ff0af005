#pragma once

#include "bitmap/core/colorClassifier.hpp"

#include <opencv2/core/mat.hpp>

namespace subocr::bitmap::core {

//! Transparent and Shadow colors are background for letter segmentation.
bool isBackground(ColorRole role);

/*! Convert a classified subtitle bitmap into the black-and-white form used by OCR.
 * \param [in] image          CV_8UC4 subtitle bitmap.
 * \param [in] classification Result of classifyColors on the same image.
 * \return     CV_8U mask of the image size. 255 for Opaque (ink), 0 for background. Empty for an empty or non CV_8UC4 image.
 */
cv::Mat buildInkMask(const cv::Mat& image, const ColorClassification& classification);

//! Visualise roles as CV_8UC3. Transparent dark grey, Shadow blue, Opaque white.
cv::Mat renderRoles(const cv::Mat& image, const ColorClassification& classification);

} // namespace subocr::bitmap::core
