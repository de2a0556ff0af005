#include <algorithm>
#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <opencv2/opencv.hpp>

#include "bitmap/core/colorClassifier.hpp"
#include "bitmap/core/debugVisualizer.hpp"

namespace subocr::bitmap::core {

//! Load a subtitle bitmap as BGRA. Images without alpha are treated as fully opaque.
static cv::Mat loadBitmap(const std::filesystem::path& path) {
	cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
	if (image.empty()) {
		return {};
	}
	if (image.depth() != CV_8U) {
		std::cerr << "Unsupported bit depth in " << path << "\n";
		return {};
	}

	if (image.channels() == 1) {
		cv::cvtColor(image, image, cv::COLOR_GRAY2BGRA);
	} else if (image.channels() == 3) {
		cv::cvtColor(image, image, cv::COLOR_BGR2BGRA);
	}
	return image;
}

//! Print one line per color, most frequent first.
static void printReport(const cv::Mat& image, const ColorClassification& colors) {
	std::unordered_map<Color, std::size_t, ColorHash> pixelCounts;
	for (int y = 0; y < image.rows; ++y) {
		const Color* row = image.ptr<Color>(y);
		for (int x = 0; x < image.cols; ++x) {
			++pixelCounts[row[x]];
		}
	}

	std::vector<std::pair<Color, std::size_t>> sorted(pixelCounts.begin(), pixelCounts.end());
	std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });

	for (const auto& [color, pixels]: sorted) {
		std::cout << std::format("#{:08x}  {:<11}  {}\n", toRgbaHex(color), toString(colors.at(color)), pixels);
	}
}

} // namespace subocr::bitmap::core

static void printUsage() {
	std::cerr << "Usage: colorInspector <image.png> [--mosaic <out.png>] [--show]\n";
}

// Developer tool: classify the colors of a single subtitle bitmap.
int main(int argc, char** argv) {
	using namespace subocr::bitmap::core;

	if (argc < 2) {
		printUsage();
		return 2;
	}

	const std::filesystem::path inputPath = argv[1];
	std::filesystem::path mosaicPath;
	bool show = false;
	for (int i = 2; i < argc; ++i) {
		const std::string_view arg(argv[i]);
		if (arg == "--mosaic" && i + 1 < argc) {
			mosaicPath = argv[++i];
		} else if (arg == "--show") {
			show = true;
		} else {
			printUsage();
			return 2;
		}
	}

	const cv::Mat image = loadBitmap(inputPath);
	if (image.empty()) {
		std::cerr << "Failed to load image: " << inputPath << "\n";
		return 1;
	}

	DebugVisualizer debug;
	debug.setInteractive(false);

	const ClassificationResult result = classifyColors(image, &debug);
	if (!result.success) {
		std::cerr << "[Error] Could not classify colors of " << inputPath << "\n";
		return 1;
	}

	printReport(image, result.colors);

	const cv::Mat mosaic = debug.buildMosaic();
	if (!mosaicPath.empty() && !cv::imwrite(mosaicPath.string(), mosaic)) {
		std::cerr << "Failed to write mosaic: " << mosaicPath << "\n";
		return 1;
	}
	if (show) {
		cv::imshow("colorInspector", mosaic);
		cv::waitKey(0);
	}

	return 0;
}
