#include "classification/core/uncertainty.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/propagation.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace geolabel::classification::core {

namespace {

constexpr double PROBABILITY_EPS = 1e-12;

void sortRanking(std::vector<RankedSegment>& ranking) {
	std::sort(ranking.begin(), ranking.end(), [](const RankedSegment& a, const RankedSegment& b) {
		if (a.entropy != b.entropy) {
			return a.entropy > b.entropy;
		}
		return a.id < b.id;
	});
}

} // namespace

UncertaintySelector::UncertaintySelector(SelectionConfig config) : m_config(config) {
}

double UncertaintySelector::entropy(const std::vector<double>& distribution) {
	const std::size_t n = distribution.size();
	if (n <= 1u) {
		return 0.0;
	}

	double total = 0.0;
	for (const double p: distribution) {
		if (std::isfinite(p) && p > 0.0) {
			total += p;
		}
	}
	if (total < PROBABILITY_EPS) {
		return 0.0;
	}

	double h = 0.0;
	for (const double raw: distribution) {
		if (!std::isfinite(raw) || raw <= 0.0) {
			continue;
		}
		const double p = raw / total;
		if (p < PROBABILITY_EPS) {
			continue;
		}
		h -= p * std::log(p);
	}

	return std::clamp(h / std::log(static_cast<double>(n)), 0.0, 1.0);
}

std::vector<RankedSegment> UncertaintySelector::rank(const FeatureTable& table, const std::vector<Prediction>& predictions, const LabelStore& labels,
                                                     bool excludeManuallyLabeled) const {
	std::vector<RankedSegment> ranking;
	ranking.reserve(predictions.size());

	for (const Prediction& p: predictions) {
		if (!table.contains(p.id)) {
			throw UnknownSegmentError("Prediction for segment " + std::to_string(p.id) + " which is not part of the feature table.");
		}
		if (excludeManuallyLabeled && labels.record(p.id).manual) {
			continue;
		}
		ranking.push_back({p.id, p.uncertainty});
	}

	sortRanking(ranking);
	return ranking;
}

std::vector<RankedSegment> UncertaintySelector::rank(const LabelStore& labels, bool excludeManuallyLabeled) const {
	std::vector<RankedSegment> ranking;
	for (const SegmentId id: labels.table().ids()) {
		const LabelRecord& rec = labels.record(id);
		if (!rec.predicted || (excludeManuallyLabeled && rec.manual)) {
			continue;
		}
		ranking.push_back({id, rec.predicted->uncertainty});
	}

	sortRanking(ranking);
	return ranking;
}

std::vector<SegmentId> UncertaintySelector::select(const std::vector<RankedSegment>& ranking, double threshold, std::size_t topK) {
	std::vector<RankedSegment> ordered = ranking;
	sortRanking(ordered);

	std::vector<SegmentId> out;
	for (const RankedSegment& r: ordered) {
		if (out.size() >= topK || r.entropy < threshold) {
			break;
		}
		out.push_back(r.id);
	}
	return out;
}

std::vector<SegmentId> UncertaintySelector::select(const std::vector<RankedSegment>& ranking) const {
	return select(ranking, m_config.threshold, m_config.topK);
}

} // namespace geolabel::classification::core
