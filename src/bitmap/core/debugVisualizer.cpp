#include "bitmap/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/opencv.hpp>

namespace subocr::bitmap::core {

void DebugVisualizer::setInteractive(bool interactive, unsigned displayTimeMs) {
	m_interactive = interactive;
	m_displayTime = displayTimeMs;
}

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "DebugVisualizer: dropping image '" << name << "', no active stage\n";
		return;
	}

	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});

	if (m_interactive && !img.empty()) {
		cv::imshow("Debug", toDisplay(img));
		cv::waitKey(static_cast<int>(m_displayTime));
		cv::destroyWindow("Debug");
	}
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

const std::vector<DebugStage>& DebugVisualizer::stages() const {
	return m_stages;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int STAGE_HEADER_H = 30;
	static constexpr int TILE_LABEL_H   = 24;
	static constexpr int TILE_IMAGE_H   = 120;
	static constexpr int TILE_PAD       = 6;
	static constexpr int MAX_IMAGE_W    = 900;
	static constexpr int MIN_TILE_W     = 160;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar HEADER_BG(0, 0, 0);
	static const cv::Scalar HEADER_FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	// Scale every image to a common height. Small bitmaps are enlarged without smoothing so single pixels stay visible.
	struct Tile {
		const DebugStep* step;
		cv::Mat vis;
	};
	std::vector<std::vector<Tile>> rows;
	int mosaicW = 0;
	for (const auto& stage: m_stages) {
		std::vector<Tile> row;
		int rowW = 0;
		for (const auto& step: stage.images) {
			cv::Mat vis;
			if (!step.image.empty()) {
				const cv::Mat display = toDisplay(step.image);
				double scale          = static_cast<double>(TILE_IMAGE_H) / static_cast<double>(display.rows);
				scale                 = std::min(scale, static_cast<double>(MAX_IMAGE_W) / static_cast<double>(display.cols));
				const int w           = std::max(1, static_cast<int>(std::lround(display.cols * scale)));
				const int h           = std::max(1, static_cast<int>(std::lround(display.rows * scale)));
				cv::resize(display, vis, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);
			}
			const int tileW = std::max(MIN_TILE_W, vis.cols) + 2 * TILE_PAD;
			rowW += tileW;
			row.push_back(Tile{&step, vis});
		}
		mosaicW = std::max(mosaicW, rowW);
		rows.push_back(std::move(row));
	}

	if (mosaicW == 0) {
		return {};
	}

	const int rowH    = STAGE_HEADER_H + TILE_LABEL_H + TILE_IMAGE_H + 2 * TILE_PAD;
	const int mosaicH = rowH * static_cast<int>(rows.size());
	cv::Mat mosaic(mosaicH, mosaicW, CV_8UC3, BG);

	for (std::size_t r = 0; r < rows.size(); ++r) {
		const int y0 = static_cast<int>(r) * rowH;

		const auto& stage = m_stages[r];
		cv::rectangle(mosaic, cv::Rect(0, y0, mosaicW, STAGE_HEADER_H), HEADER_BG, cv::FILLED);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(r + 1) : stage.name;
		cv::putText(mosaic, stageName, cv::Point(8, y0 + STAGE_HEADER_H - 9), cv::FONT_HERSHEY_SIMPLEX, 0.7, HEADER_FG, 1, cv::LINE_AA);

		int x0 = 0;
		for (const auto& tile: rows[r]) {
			const int tileW  = std::max(MIN_TILE_W, tile.vis.cols) + 2 * TILE_PAD;
			const int labelY = y0 + STAGE_HEADER_H;
			cv::putText(mosaic, tile.step->name, cv::Point(x0 + TILE_PAD, labelY + 17), cv::FONT_HERSHEY_SIMPLEX, 0.5, HEADER_FG, 1, cv::LINE_AA);

			if (!tile.vis.empty()) {
				const int imageY = labelY + TILE_LABEL_H + TILE_PAD;
				tile.vis.copyTo(mosaic(cv::Rect(x0 + TILE_PAD, imageY, tile.vis.cols, tile.vis.rows)));
			}
			x0 += tileW;
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toDisplay(const cv::Mat& in) {
	static constexpr int CHECKER_CELL = 8;

	cv::Mat out;
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		const double range = maxV - minV;
		in.convertTo(out, CV_8U, range < 1e-9 ? 1.0 : 255.0 / range, range < 1e-9 ? 0.0 : -minV * 255.0 / range);
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
		return out;
	}
	if (out.channels() != 4) {
		return out;
	}

	// Alpha blend onto a light checkerboard.
	cv::Mat blended(out.rows, out.cols, CV_8UC3);
	for (int y = 0; y < out.rows; ++y) {
		const cv::Vec4b* src = out.ptr<cv::Vec4b>(y);
		cv::Vec3b* dst       = blended.ptr<cv::Vec3b>(y);
		for (int x = 0; x < out.cols; ++x) {
			const bool dark      = ((x / CHECKER_CELL) + (y / CHECKER_CELL)) % 2 == 0;
			const double checker = dark ? 160.0 : 200.0;
			const double alpha   = src[x][3] / 255.0;
			for (int c = 0; c < 3; ++c) {
				dst[x][c] = cv::saturate_cast<uchar>(alpha * src[x][c] + (1.0 - alpha) * checker);
			}
		}
	}
	return blended;
}

} // namespace subocr::bitmap::core
