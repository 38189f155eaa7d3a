#include "statistics.hpp"

#include <cmath>
#include <utility>

namespace geolabel::classification::core {

namespace {

//! Mean and population standard deviation of one column.
std::pair<double, double> meanStddev(const cv::Mat& samples, const int col) {
	const int n = samples.rows;
	if (n == 0) {
		return {0.0, 0.0};
	}

	double sum = 0.0;
	for (int r = 0; r < n; ++r) {
		sum += samples.at<double>(r, col);
	}
	const double m = sum / static_cast<double>(n);
	if (n < 2) {
		return {m, 0.0};
	}

	double sq = 0.0;
	for (int r = 0; r < n; ++r) {
		const double d = samples.at<double>(r, col) - m;
		sq += d * d;
	}
	return {m, std::sqrt(sq / static_cast<double>(n))};
}

} // namespace

ColumnStats columnStats(const cv::Mat& samples) {
	ColumnStats stats{};
	stats.mean.reserve(static_cast<std::size_t>(samples.cols));
	stats.stddev.reserve(static_cast<std::size_t>(samples.cols));

	for (int c = 0; c < samples.cols; ++c) {
		const auto [m, s] = meanStddev(samples, c);
		stats.mean.push_back(m);
		stats.stddev.push_back(s);
	}
	return stats;
}

cv::Mat standardize(const cv::Mat& samples, const ColumnStats& stats, double minStd) {
	cv::Mat out(samples.size(), CV_64F);
	for (int r = 0; r < samples.rows; ++r) {
		const double* src = samples.ptr<double>(r);
		double* dst       = out.ptr<double>(r);
		for (int c = 0; c < samples.cols; ++c) {
			const auto col = static_cast<std::size_t>(c);
			const double s = stats.stddev[col];
			dst[c]         = (s < minStd) ? src[c] - stats.mean[col] : (src[c] - stats.mean[col]) / s;
		}
	}
	return out;
}

} // namespace geolabel::classification::core
