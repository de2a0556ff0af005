#include "bitmap/core/debugVisualizer.hpp"

#include "subtitleFixtures.hpp"

#include <gtest/gtest.h>

namespace subocr::bitmap::core {
namespace gtest {

TEST(DebugVisualizer, NoStages_EmptyMosaic) {
	DebugVisualizer debugger;
	EXPECT_TRUE(debugger.buildMosaic().empty());
}

TEST(DebugVisualizer, ImageWithoutStage_IsDropped) {
	DebugVisualizer debugger;
	debugger.add("Orphan", makeOutlinedGlyph());
	EXPECT_TRUE(debugger.stages().empty());
}

TEST(DebugVisualizer, BuildMosaic_EndsActiveStage) {
	DebugVisualizer debugger;
	debugger.beginStage("First");
	debugger.add("Bitmap", makeOutlinedGlyph());
	debugger.beginStage("Second");
	debugger.add("Mask", cv::Mat(12, 20, CV_8U, cv::Scalar(255)));
	debugger.add("Empty", cv::Mat());

	const cv::Mat mosaic = debugger.buildMosaic();
	ASSERT_EQ(debugger.stages().size(), 2u);
	EXPECT_EQ(debugger.stages()[1].images.size(), 2u);
	ASSERT_FALSE(mosaic.empty());
	EXPECT_EQ(mosaic.type(), CV_8UC3);
	EXPECT_GT(mosaic.rows, 0);
	EXPECT_GT(mosaic.cols, 0);
}

TEST(DebugVisualizer, Clear_RemovesStages) {
	DebugVisualizer debugger;
	debugger.beginStage("Stage");
	debugger.add("Bitmap", makePlainGlyph());
	debugger.endStage();
	ASSERT_EQ(debugger.stages().size(), 1u);

	debugger.clear();
	EXPECT_TRUE(debugger.stages().empty());
	EXPECT_TRUE(debugger.buildMosaic().empty());
}

} // namespace gtest
} // namespace subocr::bitmap::core
