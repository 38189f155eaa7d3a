#pragma once

#include "classification/core/config.hpp"
#include "classification/core/featureTable.hpp"
#include "classification/core/labelStore.hpp"

#include <cstddef>
#include <vector>

namespace geolabel::classification::core {

struct Prediction;

//! A segment and the model's uncertainty about it.
struct RankedSegment {
	SegmentId id;
	double entropy;
};

/*! Uncertainty sampling for the active learning loop.
 *  Ranks segments by normalised Shannon entropy of their predicted distribution. Highest first, ties by ascending id.
 */
class UncertaintySelector {
public:
	explicit UncertaintySelector(SelectionConfig config = SelectionConfig{});

	/*! Normalised Shannon entropy: -sum(p * log p) / log(n), n = distribution.size().
	 *  Input is renormalised first. Entries below 1e-12 contribute nothing.
	 * \return Value in [0,1]. 0 for point masses, single class and empty distributions. 1 for uniform.
	 */
	static double entropy(const std::vector<double>& distribution);

	/*! Rank segments of the table by entropy.
	 * \param [in] table                  Feature table defining the segment population.
	 * \param [in] predictions            Predictions of the last propagation. Segments without one are skipped.
	 * \param [in] labels                 Label overlay, used to exclude manually labelled segments.
	 * \param [in] excludeManuallyLabeled Skip segments carrying a manual label.
	 * \throws     UnknownSegmentError if a prediction refers to a segment outside the table.
	 */
	std::vector<RankedSegment> rank(const FeatureTable& table, const std::vector<Prediction>& predictions, const LabelStore& labels,
	                                bool excludeManuallyLabeled = true) const;

	//! Same as rank() using the predictions stored in the label overlay.
	std::vector<RankedSegment> rank(const LabelStore& labels, bool excludeManuallyLabeled = true) const;

	//! Ids with entropy >= threshold, at most topK, in ranking order.
	static std::vector<SegmentId> select(const std::vector<RankedSegment>& ranking, double threshold, std::size_t topK);
	//! select() with the configured threshold and topK.
	std::vector<SegmentId> select(const std::vector<RankedSegment>& ranking) const;

private:
	SelectionConfig m_config;
};

} // namespace geolabel::classification::core
