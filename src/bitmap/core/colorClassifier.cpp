#include "bitmap/core/colorClassifier.hpp"

#include "bitmap/core/inkMask.hpp"

#include "colorAdjacency.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string_view>

namespace subocr::bitmap::core {

namespace {

// Classification pipeline:
// 1) Seed       -> Transparent/Opaque per color by alpha.
// 2) Adjacency  -> neighbour role tallies per opaque color.
// 3) Shadow     -> reclassify outline colors if text sits inside an outline.
// 4) Debugging  -> overlays and optional runtime diagnostics.

namespace Debugging {

//! SUBOCR_COLOR_DEBUG=1 prints per-stage summaries, =2 adds the per-color tallies.
static int runtimeDebugLevel() {
	const char* debugEnv = std::getenv("SUBOCR_COLOR_DEBUG");
	if (debugEnv == nullptr) {
		return 0;
	}
	const std::string_view debugFlag(debugEnv);
	if (debugFlag == "1") {
		return 1;
	}
	if (debugFlag == "2") {
		return 2;
	}
	return 0;
}

static void emitClassification(std::string_view label, const ColorClassification& classification) {
	std::size_t transparent = 0u;
	std::size_t shadow      = 0u;
	std::size_t opaque      = 0u;
	for (const auto& [color, role]: classification) {
		if (role == ColorRole::Transparent) {
			++transparent;
		} else if (role == ColorRole::Shadow) {
			++shadow;
		} else {
			++opaque;
		}
	}
	std::cerr << "[color-debug] " << label << ": colors=" << classification.size() << " transparent=" << transparent << " shadow=" << shadow
	          << " opaque=" << opaque << '\n';
}

static void emitAdjacency(const AdjacencyTable& adjacency) {
	for (const auto& [color, info]: adjacency) {
		std::cerr << std::format("  #{:08x} transparent={} shadow={} opaque={} total={}\n", toRgbaHex(color), info.count(ColorRole::Transparent),
		                         info.count(ColorRole::Shadow), info.count(ColorRole::Opaque), info.total());
	}
}

} // namespace Debugging

} // namespace

const char* toString(ColorRole role) {
	switch (role) {
	case ColorRole::Transparent:
		return "Transparent";
	case ColorRole::Shadow:
		return "Shadow";
	case ColorRole::Opaque:
		return "Opaque";
	}
	return "Unknown";
}

ClassificationResult classifyColors(const cv::Mat& image, DebugVisualizer* debugger, const ClassifierConfig& config) {
	if (image.empty()) {
		return {true, {}};
	}
	if (image.type() != CV_8UC4) {
		std::cerr << "Color classification failed: expected a CV_8UC4 image, got " << image.channels() << " channel(s) of depth " << image.depth() << '\n';
		return {false, {}};
	}
	if (config.significanceDivisor == 0u) {
		std::cerr << "Color classification failed: significance divisor must be positive\n";
		return {false, {}};
	}

	const int debugLevel = Debugging::runtimeDebugLevel();

	ColorClassification classification = seedClassification(image);
	if (debugLevel > 0) {
		Debugging::emitClassification("initial", classification);
	}

	const AdjacencyTable adjacency = countAdjacency(image, classification);
	if (debugLevel > 1) {
		Debugging::emitAdjacency(adjacency);
	}

	const bool haveOpaqueInsideShadow = hasOpaqueInsideShadow(adjacency, config);
	std::size_t shadowCount           = 0u;
	if (haveOpaqueInsideShadow) {
		shadowCount = markShadowColors(adjacency, config, classification);
	}

	if (debugLevel > 0) {
		std::cerr << "[color-debug] opaqueInsideShadow=" << (haveOpaqueInsideShadow ? "yes" : "no") << " shadowColors=" << shadowCount << '\n';
		Debugging::emitClassification("final", classification);
	}

	if (debugger) {
		debugger->beginStage("Color Classification");
		debugger->add("Input", image);
		debugger->add("Roles", renderRoles(image, classification));
		debugger->add("Ink Mask", buildInkMask(image, classification));
		debugger->endStage();
	}

	return {true, std::move(classification)};
}

} // namespace subocr::bitmap::core
