#pragma once

#include "bitmap/core/colorClassifier.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <cstddef>
#include <unordered_map>

namespace subocr::bitmap::core {

//! Counts how many 8-neighbours of a color's pixels have each ColorRole.
class AdjacencyInfo {
public:
	std::size_t count(ColorRole role) const;
	void increment(ColorRole role);
	std::size_t total() const;

	//! Share of neighbours with the given role.
	//! \note Only valid for total() > 0.
	double fraction(ColorRole role) const;

private:
	static std::size_t slot(ColorRole role);

private:
	std::array<std::size_t, 3> m_counts{}; //!< Indexed by slot(role).
};

//! Adjacency tallies for every non-transparent color.
using AdjacencyTable = std::unordered_map<Color, AdjacencyInfo, ColorHash>;

/*! Initial split by alpha. The first observation of a color decides its role.
 * \param [in] image CV_8UC4 subtitle bitmap.
 * \return     Every color of the image as either Transparent or Opaque.
 */
ColorClassification seedClassification(const cv::Mat& image);

/*! Tally the roles of the 3x3 neighbourhood around every non-transparent pixel.
 *  Out of bounds neighbours count as Transparent, neighbours of the same color are skipped.
 * \param [in] image          CV_8UC4 subtitle bitmap.
 * \param [in] classification Seeded classification of the same image.
 * \return     One entry per non-transparent color.
 * \note       Throws std::out_of_range if a neighbour color is missing from the classification.
 */
AdjacencyTable countAdjacency(const cv::Mat& image, const ColorClassification& classification);

//! True if some significant color is almost entirely surrounded by opaque colors.
bool hasOpaqueInsideShadow(const AdjacencyTable& adjacency, const ClassifierConfig& config);

//! True if the color borders both opaque and transparent pixels substantially.
bool looksLikeShadow(const AdjacencyInfo& info, const ClassifierConfig& config);

/*! Overwrite the role of every shadow-looking color with Shadow.
 * \return Number of colors reclassified.
 */
std::size_t markShadowColors(const AdjacencyTable& adjacency, const ClassifierConfig& config, ColorClassification& classification);

} // namespace subocr::bitmap::core
