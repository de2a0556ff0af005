#include "bitmap/core/inkMask.hpp"

#include <iostream>

namespace subocr::bitmap::core {

namespace {

static const cv::Vec3b TRANSPARENT_BGR(40, 40, 40);
static const cv::Vec3b SHADOW_BGR(200, 80, 0);
static const cv::Vec3b OPAQUE_BGR(255, 255, 255);
static const cv::Vec3b UNKNOWN_BGR(0, 0, 255);

//! Role of a pixel color. Unclassified colors are logged once per call and reported as nullptr.
class RoleLookup {
public:
	explicit RoleLookup(const ColorClassification& classification) : m_classification(classification) {
	}

	const ColorRole* find(const Color& color) {
		const auto it = m_classification.find(color);
		if (it != m_classification.end()) {
			return &it->second;
		}
		if (!m_reported) {
			std::cerr << "Ink mask: color #" << std::hex << toRgbaHex(color) << std::dec << " has no classification, treating as background\n";
			m_reported = true;
		}
		return nullptr;
	}

private:
	const ColorClassification& m_classification;
	bool m_reported{false};
};

} // namespace

bool isBackground(ColorRole role) {
	return role == ColorRole::Transparent || role == ColorRole::Shadow;
}

cv::Mat buildInkMask(const cv::Mat& image, const ColorClassification& classification) {
	if (image.empty() || image.type() != CV_8UC4) {
		return {};
	}

	RoleLookup lookup(classification);
	cv::Mat mask(image.rows, image.cols, CV_8U, cv::Scalar(0));
	for (int y = 0; y < image.rows; ++y) {
		const Color* src = image.ptr<Color>(y);
		std::uint8_t* dst = mask.ptr<std::uint8_t>(y);
		for (int x = 0; x < image.cols; ++x) {
			const ColorRole* role = lookup.find(src[x]);
			dst[x]                = (role != nullptr && !isBackground(*role)) ? 255u : 0u;
		}
	}
	return mask;
}

cv::Mat renderRoles(const cv::Mat& image, const ColorClassification& classification) {
	if (image.empty() || image.type() != CV_8UC4) {
		return {};
	}

	RoleLookup lookup(classification);
	cv::Mat out(image.rows, image.cols, CV_8UC3);
	for (int y = 0; y < image.rows; ++y) {
		const Color* src = image.ptr<Color>(y);
		cv::Vec3b* dst   = out.ptr<cv::Vec3b>(y);
		for (int x = 0; x < image.cols; ++x) {
			const ColorRole* role = lookup.find(src[x]);
			if (role == nullptr) {
				dst[x] = UNKNOWN_BGR;
				continue;
			}
			switch (*role) {
			case ColorRole::Transparent:
				dst[x] = TRANSPARENT_BGR;
				break;
			case ColorRole::Shadow:
				dst[x] = SHADOW_BGR;
				break;
			case ColorRole::Opaque:
				dst[x] = OPAQUE_BGR;
				break;
			}
		}
	}
	return out;
}

} // namespace subocr::bitmap::core
