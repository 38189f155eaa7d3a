#pragma once

#include <opencv2/core/mat.hpp>

#include <vector>

namespace geolabel::classification::core {

//! Per column mean and population standard deviation of a CV_64F sample matrix (rows = samples).
struct ColumnStats {
	std::vector<double> mean;
	std::vector<double> stddev;
};

ColumnStats columnStats(const cv::Mat& samples);

//! (x - mean) / stddev per column. Columns with stddev below minStd are only centered.
cv::Mat standardize(const cv::Mat& samples, const ColumnStats& stats, double minStd = 1e-12);

} // namespace geolabel::classification::core
