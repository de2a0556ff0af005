#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace subocr::bitmap::core {

//! A single subtitle bitmap color in OpenCV channel order (B, G, R, A).
using Color = cv::Vec4b;

//! Hash for using Color as an unordered_map key.
struct ColorHash {
	std::size_t operator()(const Color& color) const;
};

//! True if the color is fully or partially transparent (alpha < 255).
bool isTransparent(const Color& color);

/*! Bounds-checked pixel lookup on a CV_8UC4 image.
 * \param [in] image BGRA subtitle bitmap.
 * \param [in] x     Column. May be negative or past the right edge.
 * \param [in] y     Row. May be negative or past the bottom edge.
 * \return     The pixel color, or nullopt if (x, y) lies outside the image.
 */
std::optional<Color> pixelAt(const cv::Mat& image, int x, int y);

//! Build a color from the usual 0xRRGGBBAA notation.
Color colorFromRgbaHex(std::uint32_t rgba);

//! Inverse of colorFromRgbaHex.
std::uint32_t toRgbaHex(const Color& color);

} // namespace subocr::bitmap::core
