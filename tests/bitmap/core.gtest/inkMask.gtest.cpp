#include "bitmap/core/inkMask.hpp"

#include "subtitleFixtures.hpp"

#include <gtest/gtest.h>

namespace subocr::bitmap::core {
namespace gtest {

TEST(InkMask, BackgroundRoles) {
	EXPECT_TRUE(isBackground(ColorRole::Transparent));
	EXPECT_TRUE(isBackground(ColorRole::Shadow));
	EXPECT_FALSE(isBackground(ColorRole::Opaque));
}

TEST(InkMask, OutlinedGlyph_OnlyBodyIsInk) {
	const cv::Mat image               = makeOutlinedGlyph();
	const ClassificationResult result = classifyColors(image);
	ASSERT_TRUE(result.success);

	const cv::Mat mask = buildInkMask(image, result.colors);
	ASSERT_EQ(mask.type(), CV_8U);
	ASSERT_EQ(mask.size(), image.size());

	// Body and highlight are 12x6, the outline ring and the background are not ink.
	EXPECT_EQ(cv::countNonZero(mask), 12 * 6);
	EXPECT_EQ(mask.at<std::uint8_t>(0, 0), 0);   // background
	EXPECT_EQ(mask.at<std::uint8_t>(2, 3), 0);   // outline
	EXPECT_EQ(mask.at<std::uint8_t>(3, 4), 255); // body
	EXPECT_EQ(mask.at<std::uint8_t>(5, 6), 255); // highlight
}

TEST(InkMask, UnclassifiedColor_IsBackground) {
	cv::Mat image = makeBitmap(2, 1, FILL);
	image.at<Color>(0, 1) = HIGHLIGHT;

	const ColorClassification partial{{FILL, ColorRole::Opaque}};
	const cv::Mat mask = buildInkMask(image, partial);
	ASSERT_FALSE(mask.empty());
	EXPECT_EQ(mask.at<std::uint8_t>(0, 0), 255);
	EXPECT_EQ(mask.at<std::uint8_t>(0, 1), 0);
}

TEST(InkMask, InvalidInput_EmptyMask) {
	EXPECT_TRUE(buildInkMask(cv::Mat(), {}).empty());
	EXPECT_TRUE(buildInkMask(cv::Mat(3, 3, CV_8UC3, cv::Scalar(0, 0, 0)), {}).empty());
	EXPECT_TRUE(renderRoles(cv::Mat(), {}).empty());
}

TEST(InkMask, RenderRoles_DistinctPerRole) {
	const cv::Mat image               = makeOutlinedGlyph();
	const ClassificationResult result = classifyColors(image);
	ASSERT_TRUE(result.success);

	const cv::Mat roles = renderRoles(image, result.colors);
	ASSERT_EQ(roles.type(), CV_8UC3);
	ASSERT_EQ(roles.size(), image.size());

	const cv::Vec3b background = roles.at<cv::Vec3b>(0, 0);
	const cv::Vec3b outline    = roles.at<cv::Vec3b>(2, 3);
	const cv::Vec3b body       = roles.at<cv::Vec3b>(3, 4);
	const cv::Vec3b highlight  = roles.at<cv::Vec3b>(5, 6);
	EXPECT_NE(background, outline);
	EXPECT_NE(outline, body);
	EXPECT_EQ(body, highlight);
}

} // namespace gtest
} // namespace subocr::bitmap::core
