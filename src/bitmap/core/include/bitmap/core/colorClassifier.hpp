#pragma once

#include "bitmap/core/debugVisualizer.hpp"
#include "bitmap/core/pixelAccess.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string_view>
#include <unordered_map>

// Color classification is the first step in preparing a subtitle bitmap for OCR.
// Motivation: Rendered subtitles contain glyph ink, an outline or drop shadow around the glyphs and a transparent background. Letter segmentation only
// works if the outline is treated as background, otherwise neighbouring letters are glued together by their shadows.
// Process:
//   1) Split colors into Transparent and Opaque by alpha.
//   2) Count, per opaque color, the roles of its 8-neighbours over the whole image.
//   3) If a dominant color sits almost entirely inside other opaque colors, we have text inside an outline. Colors bordering both the inside and the
//   transparent background are then the outline, i.e. Shadow.
namespace subocr::bitmap::core {

//! Semantic role of a color in a subtitle bitmap.
enum class ColorRole { Transparent, Shadow, Opaque };

const char* toString(ColorRole role);

//! Role per distinct color of an image.
using ColorClassification = std::unordered_map<Color, ColorRole, ColorHash>;

//! Heuristic thresholds of the shadow detection. Tuned on real subtitle tracks.
struct ClassifierConfig {
	std::size_t significanceDivisor{4u};        //!< Color takes part in the inside-shadow check if its tally >= total tally / divisor.
	double opaqueInsideShadowMinFraction{0.95}; //!< Opaque neighbour fraction above which a significant color sits inside a shadow.
	double shadowMinOpaqueFraction{0.33};       //!< Shadow colors border opaque colors more than this fraction.
	double shadowMinTransparentFraction{0.33};  //!< ... and transparent pixels more than this fraction.
};

//! Result of the color classification.
struct ClassificationResult {
	bool success;               //!< False on invalid input (image is not CV_8UC4).
	ColorClassification colors; //!< Every distinct color of the image mapped to its role. Empty if !success.
};

/*! Classify every distinct color of a subtitle bitmap as Transparent, Shadow or Opaque.
 * \param [in]     image    Decoded subtitle bitmap, CV_8UC4 in BGRA order. Any alpha below 255 counts as transparent.
 * \param [in,out] debugger Optional debug visualizer for the role and ink mask images.
 * \param [in]     config   Shadow detection thresholds.
 * \return         ClassificationResult. Consumers treat Transparent and Shadow as background and Opaque as glyph ink.
 * \note           Throws std::out_of_range if a neighbour color was not seeded. This is a logic error, never an input error.
 */
ClassificationResult classifyColors(const cv::Mat& image, DebugVisualizer* debugger = nullptr, const ClassifierConfig& config = ClassifierConfig{});

} // namespace subocr::bitmap::core
