#pragma once

#include <opencv2/core/mat.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geolabel::classification::core {

using SegmentId = std::int32_t;

//! One row as delivered by the segmentation step.
struct SegmentRow {
	SegmentId id;            //!< Stable id, unique per project.
	std::string geometry;    //!< Opaque geometry (passed through to the result view untouched).
	std::vector<double> features; //!< Band statistics and spectral indices. Same length for every row.
};

/*! Immutable per-segment feature matrix.
 *  Rows keep the order of construction. Features are stored as a single CV_64F matrix (rows = segments).
 */
class FeatureTable {
public:
	FeatureTable() = default;

	/*! Build the table.
	 * \param [in] featureNames Column names. May be empty, then names are generated ("f0", "f1", ...).
	 * \param [in] rows         Segment rows.
	 * \throws     FeatureDimensionMismatchError if rows differ in length or do not match featureNames. The message names the offending segment.
	 * \throws     UnknownSegmentError if an id occurs twice.
	 * \note       Non-finite values are accepted here. They are rejected when the table is used for propagation (see requireFinite()).
	 */
	FeatureTable(std::vector<std::string> featureNames, std::vector<SegmentRow> rows);

	//! Load a table written by save() or produced by the segmentation step (OpenCV FileStorage, YAML or JSON).
	static FeatureTable load(const std::string& path);
	void save(const std::string& path) const;

	std::size_t size() const {
		return m_ids.size();
	}
	std::size_t dimension() const {
		return m_featureNames.size();
	}
	bool empty() const {
		return m_ids.empty();
	}

	const std::vector<SegmentId>& ids() const {
		return m_ids;
	}
	const std::vector<std::string>& featureNames() const {
		return m_featureNames;
	}
	const cv::Mat& features() const { //!< size() x dimension(), CV_64F.
		return m_features;
	}

	bool contains(SegmentId id) const;
	std::optional<std::size_t> indexOf(SegmentId id) const;
	std::size_t rowOf(SegmentId id) const; //!< Throws UnknownSegmentError.
	const std::string& geometry(std::size_t row) const;

	//! First segment carrying a NaN/Inf feature, if any.
	std::optional<SegmentId> firstNonFinite() const;
	//! Throws FeatureDimensionMismatchError naming the first segment with a non-finite feature.
	void requireFinite() const;

private:
	std::vector<std::string> m_featureNames{};
	std::vector<SegmentId> m_ids{};
	std::vector<std::string> m_geometry{};
	cv::Mat m_features{};
	std::unordered_map<SegmentId, std::size_t> m_index{};
};

} // namespace geolabel::classification::core
