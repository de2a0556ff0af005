#include "bitmap/core/pixelAccess.hpp"

#include <functional>

namespace subocr::bitmap::core {

static constexpr std::uint8_t ALPHA_OPAQUE = 0xff;

std::size_t ColorHash::operator()(const Color& color) const {
	const std::uint32_t packed = (static_cast<std::uint32_t>(color[0]) << 24u) | (static_cast<std::uint32_t>(color[1]) << 16u) |
	                             (static_cast<std::uint32_t>(color[2]) << 8u) | static_cast<std::uint32_t>(color[3]);
	return std::hash<std::uint32_t>{}(packed);
}

bool isTransparent(const Color& color) {
	return color[3] < ALPHA_OPAQUE;
}

std::optional<Color> pixelAt(const cv::Mat& image, int x, int y) {
	if (x < 0 || y < 0 || x >= image.cols || y >= image.rows) {
		return std::nullopt;
	}
	return image.at<Color>(y, x);
}

Color colorFromRgbaHex(std::uint32_t rgba) {
	const auto r = static_cast<std::uint8_t>((rgba >> 24u) & 0xffu);
	const auto g = static_cast<std::uint8_t>((rgba >> 16u) & 0xffu);
	const auto b = static_cast<std::uint8_t>((rgba >> 8u) & 0xffu);
	const auto a = static_cast<std::uint8_t>(rgba & 0xffu);
	return {b, g, r, a};
}

std::uint32_t toRgbaHex(const Color& color) {
	return (static_cast<std::uint32_t>(color[2]) << 24u) | (static_cast<std::uint32_t>(color[1]) << 16u) | (static_cast<std::uint32_t>(color[0]) << 8u) |
	       static_cast<std::uint32_t>(color[3]);
}

} // namespace subocr::bitmap::core
