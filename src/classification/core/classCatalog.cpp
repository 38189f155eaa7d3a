#include "classification/core/classCatalog.hpp"

#include "classification/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <format>

namespace geolabel::classification::core {

namespace {

constexpr float FALLBACK_SATURATION = 0.65f;
constexpr float FALLBACK_LIGHTNESS  = 0.45f;

std::string toLowerHex(std::string_view color) {
	std::string out(color);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

int toByte(float v) {
	return std::clamp(static_cast<int>(std::lround(v * 255.0f)), 0, 255);
}

} // namespace

std::string ClassCatalog::normalize(std::string_view name) {
	const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

	while (!name.empty() && isSpace(static_cast<unsigned char>(name.front()))) {
		name.remove_prefix(1);
	}
	while (!name.empty() && isSpace(static_cast<unsigned char>(name.back()))) {
		name.remove_suffix(1);
	}

	std::string out(name);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return out;
}

std::string ClassCatalog::fallbackColor(std::string_view name) {
	const std::string key = normalize(name);
	if (key.empty()) {
		return std::string(UNCLASSIFIED_COLOR);
	}

	std::uint32_t hash = 7u;
	for (const unsigned char c: key) {
		hash = hash * 31u + c;
	}
	const float hue = static_cast<float>(hash % 360u);

	// HLS -> BGR on a single pixel. Float input: H in [0,360), L and S in [0,1].
	const cv::Mat hls(1, 1, CV_32FC3, cv::Scalar(hue, FALLBACK_LIGHTNESS, FALLBACK_SATURATION));
	cv::Mat bgr;
	cv::cvtColor(hls, bgr, cv::COLOR_HLS2BGR);

	const cv::Vec3f px = bgr.at<cv::Vec3f>(0, 0);
	return std::format("#{:02x}{:02x}{:02x}", toByte(px[2]), toByte(px[1]), toByte(px[0]));
}

bool ClassCatalog::isValidColor(std::string_view color) {
	if (color.size() != 7u || color.front() != '#') {
		return false;
	}
	return std::all_of(color.begin() + 1, color.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string ClassCatalog::registerClass(std::string_view name, std::string_view requestedColor) {
	std::string key = normalize(name);
	if (key.empty()) {
		throw InvalidClassError("Class name must not be empty.");
	}

	const auto it = m_colors.find(key);
	if (it != m_colors.end()) {
		return it->second;
	}

	std::string color = isValidColor(requestedColor) ? toLowerHex(requestedColor) : fallbackColor(key);
	m_colors.emplace(std::move(key), color);
	return color;
}

void ClassCatalog::remove(std::string_view name) {
	const auto it = m_colors.find(normalize(name));
	if (it != m_colors.end()) {
		m_colors.erase(it);
	}
}

std::string ClassCatalog::colorOf(std::string_view name) const {
	const std::string key = normalize(name);
	const auto it         = m_colors.find(key);
	if (it != m_colors.end()) {
		return it->second;
	}
	return fallbackColor(key);
}

bool ClassCatalog::contains(std::string_view name) const {
	return m_colors.find(normalize(name)) != m_colors.end();
}

std::vector<ClassEntry> ClassCatalog::entries() const {
	std::vector<ClassEntry> out;
	out.reserve(m_colors.size());
	for (const auto& [name, color]: m_colors) {
		out.push_back({name, color});
	}
	return out;
}

} // namespace geolabel::classification::core
