#include "affinityGraph.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace geolabel::classification::core {

namespace {

void finalizeRow(std::vector<Edge>& row) {
	std::sort(row.begin(), row.end(), [](const Edge& a, const Edge& b) { return a.target < b.target; });
	row.erase(std::unique(row.begin(), row.end(), [](const Edge& a, const Edge& b) { return a.target == b.target; }), row.end());
}

AffinityGraph buildKnn(const cv::Mat& samples, const int neighbors) {
	const int n = samples.rows;
	AffinityGraph graph{};
	graph.adjacency.resize(static_cast<std::size_t>(n));
	graph.degree.assign(static_cast<std::size_t>(n), 0.0);
	if (n < 2 || neighbors <= 0) {
		return graph;
	}

	// batchDistance works on CV_32F. Ask for one extra neighbour since every row finds itself.
	cv::Mat samples32;
	samples.convertTo(samples32, CV_32F);
	const int k = std::min(neighbors + 1, n);

	cv::Mat dist;
	cv::Mat nidx;
	cv::batchDistance(samples32, samples32, dist, CV_32F, nidx, cv::NORM_L2SQR, k);

	for (int i = 0; i < n; ++i) {
		const int* idx = nidx.ptr<int>(i);
		int added      = 0;
		for (int c = 0; c < k && added < neighbors; ++c) {
			const int j = idx[c];
			if (j < 0 || j == i) {
				continue;
			}
			graph.adjacency[static_cast<std::size_t>(i)].push_back({j, 1.0});
			graph.adjacency[static_cast<std::size_t>(j)].push_back({i, 1.0});
			++added;
		}
	}

	for (std::size_t i = 0; i < graph.adjacency.size(); ++i) {
		finalizeRow(graph.adjacency[i]);
		graph.degree[i] = static_cast<double>(graph.adjacency[i].size());
	}
	return graph;
}

AffinityGraph buildRbf(const cv::Mat& samples, const double gamma) {
	const int n = samples.rows;
	AffinityGraph graph{};
	graph.adjacency.resize(static_cast<std::size_t>(n));
	graph.degree.assign(static_cast<std::size_t>(n), 0.0);

	for (int i = 0; i < n; ++i) {
		const double* xi = samples.ptr<double>(i);
		for (int j = i + 1; j < n; ++j) {
			const double* xj = samples.ptr<double>(j);
			double d2        = 0.0;
			for (int c = 0; c < samples.cols; ++c) {
				const double d = xi[c] - xj[c];
				d2 += d * d;
			}

			const double w = std::exp(-gamma * d2);
			if (!(w > 0.0)) {
				continue;
			}
			graph.adjacency[static_cast<std::size_t>(i)].push_back({j, w});
			graph.adjacency[static_cast<std::size_t>(j)].push_back({i, w});
		}
	}

	for (std::size_t i = 0; i < graph.adjacency.size(); ++i) {
		finalizeRow(graph.adjacency[i]);
		graph.degree[i] = std::accumulate(graph.adjacency[i].begin(), graph.adjacency[i].end(), 0.0,
		                                  [](double acc, const Edge& e) { return acc + e.weight; });
	}
	return graph;
}

} // namespace

std::size_t AffinityGraph::edgeCount() const {
	std::size_t directed = 0u;
	for (const auto& row: adjacency) {
		directed += row.size();
	}
	return directed / 2u;
}

AffinityGraph buildAffinityGraph(const cv::Mat& samples, const GraphConfig& config) {
	switch (config.kernel) {
	case GraphKernel::Knn:
		return buildKnn(samples, config.neighbors);
	case GraphKernel::Rbf:
		return buildRbf(samples, config.gamma);
	}
	return buildKnn(samples, config.neighbors);
}

} // namespace geolabel::classification::core
