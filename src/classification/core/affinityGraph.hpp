#pragma once

#include "classification/core/config.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <vector>

namespace geolabel::classification::core {

struct Edge {
	int target;    //!< Row index of the neighbour.
	double weight; //!< Affinity, > 0.
};

//! Sparse symmetric affinity graph over the rows of a sample matrix. No self loops.
struct AffinityGraph {
	std::vector<std::vector<Edge>> adjacency{}; //!< Neighbours per row, sorted by target.
	std::vector<double> degree{};               //!< Sum of edge weights per row.

	std::size_t size() const {
		return adjacency.size();
	}
	std::size_t edgeCount() const; //!< Undirected edges.
};

/*! Build the affinity graph of standardized samples.
 *  Knn: connect every row to its k nearest rows (squared L2), then symmetrise (union). Unit weights.
 *  Rbf: dense exp(-gamma * |xi - xj|^2). Weights that underflow to zero are dropped.
 * \param [in] samples CV_64F, rows = segments.
 * \param [in] config  Kernel parameters.
 */
AffinityGraph buildAffinityGraph(const cv::Mat& samples, const GraphConfig& config);

} // namespace geolabel::classification::core
