#pragma once

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace subocr::bitmap::core {

//! Single image produced by a step of the classification.
struct DebugStep {
	std::string name; //!< Label drawn above the tile.
	cv::Mat image;    //!< Copy of the image. BGRA, BGR or single channel.
};

//! All images of one stage. Rendered as one row of the mosaic.
struct DebugStage {
	std::string name;
	std::vector<DebugStep> images{};
};

//! Collects intermediate images of the bitmap pipeline for inspection. Passed as optional pointer into the processing functions.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Starts a new stage. Ends the active one first.
	void add(std::string name, const cv::Mat& img); //!< Add an image to the active stage. Shows it right away in interactive mode.
	void endStage();

	//! Mosaic with one row per stage and the stage images side by side. Ends the active stage.
	//! Subtitle bitmaps are wide and short, so tiles keep the aspect ratio of their image.
	cv::Mat buildMosaic();

	void setInteractive(bool interactive, unsigned displayTimeMs = 0u);
	void clear();

	const std::vector<DebugStage>& stages() const; //!< Finished stages.

private:
	static cv::Mat toDisplay(const cv::Mat& in); //!< Convert to CV_8UC3. Alpha is composited on a checkerboard.

private:
	bool m_interactive{false};  //!< Show images as they are added.
	unsigned m_displayTime{0u}; //!< Milliseconds per image in interactive mode. 0 -> wait for key.

	DebugStage m_currentStage{};
	bool m_hasActiveStage{false};
	std::vector<DebugStage> m_stages{};
};

} // namespace subocr::bitmap::core
