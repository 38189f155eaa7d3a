#include "classification/core/featureTable.hpp"

#include "classification/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/persistence.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace geolabel::classification::core {

FeatureTable::FeatureTable(std::vector<std::string> featureNames, std::vector<SegmentRow> rows) : m_featureNames(std::move(featureNames)) {
	if (m_featureNames.empty() && !rows.empty()) {
		for (std::size_t i = 0; i < rows.front().features.size(); ++i) {
			m_featureNames.push_back("f" + std::to_string(i));
		}
	}

	const std::size_t dim = m_featureNames.size();
	m_features            = cv::Mat(static_cast<int>(rows.size()), static_cast<int>(dim), CV_64F);
	m_ids.reserve(rows.size());
	m_geometry.reserve(rows.size());
	m_index.reserve(rows.size());

	for (std::size_t r = 0; r < rows.size(); ++r) {
		SegmentRow& row = rows[r];
		if (row.features.size() != dim) {
			throw FeatureDimensionMismatchError("Segment " + std::to_string(row.id) + " has " + std::to_string(row.features.size()) +
			                                    " features, expected " + std::to_string(dim) + ".");
		}
		if (!m_index.emplace(row.id, r).second) {
			throw UnknownSegmentError("Segment id " + std::to_string(row.id) + " occurs more than once in the feature table.");
		}

		double* dst = m_features.ptr<double>(static_cast<int>(r));
		std::copy(row.features.begin(), row.features.end(), dst);
		m_ids.push_back(row.id);
		m_geometry.push_back(std::move(row.geometry));
	}
}

bool FeatureTable::contains(const SegmentId id) const {
	return m_index.find(id) != m_index.end();
}

std::optional<std::size_t> FeatureTable::indexOf(const SegmentId id) const {
	const auto it = m_index.find(id);
	if (it == m_index.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::size_t FeatureTable::rowOf(const SegmentId id) const {
	const auto it = m_index.find(id);
	if (it == m_index.end()) {
		throw UnknownSegmentError("Segment " + std::to_string(id) + " is not part of the feature table.");
	}
	return it->second;
}

const std::string& FeatureTable::geometry(const std::size_t row) const {
	return m_geometry.at(row);
}

std::optional<SegmentId> FeatureTable::firstNonFinite() const {
	if (m_features.empty()) {
		return std::nullopt;
	}

	cv::Point pos;
	if (cv::checkRange(m_features, true, &pos)) {
		return std::nullopt;
	}
	return m_ids[static_cast<std::size_t>(pos.y)];
}

void FeatureTable::requireFinite() const {
	if (const auto bad = firstNonFinite()) {
		const std::size_t row = rowOf(*bad);
		const double* values  = m_features.ptr<double>(static_cast<int>(row));
		for (std::size_t c = 0; c < dimension(); ++c) {
			if (!std::isfinite(values[c])) {
				throw FeatureDimensionMismatchError("Segment " + std::to_string(*bad) + " has a non-finite value in feature '" + m_featureNames[c] +
				                                    "'.");
			}
		}
		throw FeatureDimensionMismatchError("Segment " + std::to_string(*bad) + " has a non-finite feature value.");
	}
}

FeatureTable FeatureTable::load(const std::string& path) {
	std::vector<std::string> names;
	std::vector<SegmentRow> rows;

	try {
		cv::FileStorage fs(path, cv::FileStorage::READ);
		if (!fs.isOpened()) {
			throw PersistenceError("Could not open feature table '" + path + "'.");
		}

		fs["featureNames"] >> names;

		const cv::FileNode segments = fs["segments"];
		if (!segments.isSeq() && !segments.empty()) {
			throw PersistenceError("Feature table '" + path + "': 'segments' must be a sequence.");
		}

		rows.reserve(segments.size());
		for (const cv::FileNode& node: segments) {
			SegmentRow row{};
			row.id = static_cast<SegmentId>(static_cast<int>(node["id"]));
			node["geometry"] >> row.geometry;
			node["features"] >> row.features;
			rows.push_back(std::move(row));
		}
	} catch (const cv::Exception& e) {
		throw PersistenceError("Could not parse feature table '" + path + "': " + e.what());
	}

	return FeatureTable(std::move(names), std::move(rows));
}

void FeatureTable::save(const std::string& path) const {
	try {
		cv::FileStorage fs(path, cv::FileStorage::WRITE);
		if (!fs.isOpened()) {
			throw PersistenceError("Could not write feature table '" + path + "'.");
		}

		fs << "featureNames" << m_featureNames;
		fs << "segments" << "[";
		for (std::size_t r = 0; r < m_ids.size(); ++r) {
			const double* values = m_features.ptr<double>(static_cast<int>(r));
			fs << "{";
			fs << "id" << static_cast<int>(m_ids[r]);
			fs << "geometry" << m_geometry[r];
			fs << "features" << std::vector<double>(values, values + dimension());
			fs << "}";
		}
		fs << "]";
	} catch (const cv::Exception& e) {
		throw PersistenceError("Could not write feature table '" + path + "': " + e.what());
	}
}

} // namespace geolabel::classification::core
