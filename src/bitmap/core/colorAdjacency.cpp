#include "colorAdjacency.hpp"

#include <numeric>

namespace subocr::bitmap::core {

std::size_t AdjacencyInfo::slot(ColorRole role) {
	switch (role) {
	case ColorRole::Transparent:
		return 0u;
	case ColorRole::Shadow:
		return 1u;
	case ColorRole::Opaque:
		return 2u;
	}
	return 0u;
}

std::size_t AdjacencyInfo::count(ColorRole role) const {
	return m_counts[slot(role)];
}

void AdjacencyInfo::increment(ColorRole role) {
	++m_counts[slot(role)];
}

std::size_t AdjacencyInfo::total() const {
	return std::accumulate(m_counts.begin(), m_counts.end(), std::size_t{0});
}

double AdjacencyInfo::fraction(ColorRole role) const {
	return static_cast<double>(count(role)) / static_cast<double>(total());
}

ColorClassification seedClassification(const cv::Mat& image) {
	ColorClassification classification;
	for (int y = 0; y < image.rows; ++y) {
		const Color* row = image.ptr<Color>(y);
		for (int x = 0; x < image.cols; ++x) {
			const Color& color = row[x];
			if (classification.find(color) != classification.end()) {
				continue; // First observation wins.
			}
			classification.emplace(color, isTransparent(color) ? ColorRole::Transparent : ColorRole::Opaque);
		}
	}
	return classification;
}

AdjacencyTable countAdjacency(const cv::Mat& image, const ColorClassification& classification) {
	AdjacencyTable adjacency;
	for (const auto& [color, role]: classification) {
		if (!isTransparent(color)) {
			adjacency.emplace(color, AdjacencyInfo{});
		}
	}

	for (int y = 0; y < image.rows; ++y) {
		const Color* row = image.ptr<Color>(y);
		for (int x = 0; x < image.cols; ++x) {
			const Color& color = row[x];
			if (isTransparent(color)) {
				continue;
			}

			AdjacencyInfo& info = adjacency.at(color);
			for (int dy = -1; dy <= 1; ++dy) {
				for (int dx = -1; dx <= 1; ++dx) {
					if (dx == 0 && dy == 0) {
						continue;
					}

					const std::optional<Color> neighbour = pixelAt(image, x + dx, y + dy);
					if (!neighbour) {
						info.increment(ColorRole::Transparent);
						continue;
					}
					if (*neighbour == color) {
						continue;
					}
					info.increment(classification.at(*neighbour));
				}
			}
		}
	}
	return adjacency;
}

bool hasOpaqueInsideShadow(const AdjacencyTable& adjacency, const ClassifierConfig& config) {
	std::size_t totalAdjacent = 0u;
	for (const auto& [color, info]: adjacency) {
		totalAdjacent += info.total();
	}
	const std::size_t significantTotal = totalAdjacent / config.significanceDivisor;

	for (const auto& [color, info]: adjacency) {
		if (info.total() == 0u || info.total() < significantTotal) {
			continue;
		}
		if (info.fraction(ColorRole::Opaque) > config.opaqueInsideShadowMinFraction) {
			return true;
		}
	}
	return false;
}

bool looksLikeShadow(const AdjacencyInfo& info, const ClassifierConfig& config) {
	if (info.total() == 0u) {
		return false;
	}
	return info.fraction(ColorRole::Opaque) > config.shadowMinOpaqueFraction && info.fraction(ColorRole::Transparent) > config.shadowMinTransparentFraction;
}

std::size_t markShadowColors(const AdjacencyTable& adjacency, const ClassifierConfig& config, ColorClassification& classification) {
	std::size_t marked = 0u;
	for (const auto& [color, info]: adjacency) {
		if (!looksLikeShadow(info, config)) {
			continue;
		}
		classification.at(color) = ColorRole::Shadow;
		++marked;
	}
	return marked;
}

} // namespace subocr::bitmap::core
