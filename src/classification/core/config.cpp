#include "classification/core/config.hpp"

#include "classification/core/errors.hpp"

#include <opencv2/core/persistence.hpp>

#include <algorithm>
#include <cctype>

namespace geolabel::classification::core {

namespace {

template<typename T>
void readIfPresent(const cv::FileNode& parent, const char* key, T& value) {
	const cv::FileNode node = parent[key];
	if (!node.empty()) {
		node >> value;
	}
}

void readFlag(const cv::FileNode& parent, const char* key, bool& value) {
	const cv::FileNode node = parent[key];
	if (node.empty()) {
		return;
	}
	int raw = value ? 1 : 0;
	node >> raw;
	value = raw != 0;
}

GraphKernel parseKernel(std::string name) {
	std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (name == "knn") {
		return GraphKernel::Knn;
	}
	if (name == "rbf") {
		return GraphKernel::Rbf;
	}
	throw PersistenceError("Unknown graph kernel '" + name + "' in configuration (expected knn or rbf).");
}

void readPropagation(const cv::FileNode& node, PropagationConfig& config) {
	if (node.empty()) {
		return;
	}

	const cv::FileNode graph = node["graph"];
	if (!graph.empty()) {
		std::string kernel;
		readIfPresent(graph, "kernel", kernel);
		if (!kernel.empty()) {
			config.graph.kernel = parseKernel(kernel);
		}
		readIfPresent(graph, "neighbors", config.graph.neighbors);
		readIfPresent(graph, "gamma", config.graph.gamma);
	}

	readFlag(node, "standardize", config.standardize);
	readIfPresent(node, "maxIterations", config.maxIterations);
	readIfPresent(node, "tolerance", config.tolerance);
	readIfPresent(node, "alpha", config.alpha);
	readIfPresent(node, "selfTrainingNeighbors", config.selfTrainingNeighbors);
	readIfPresent(node, "selfTrainingThreshold", config.selfTrainingThreshold);
	readIfPresent(node, "selfTrainingRounds", config.selfTrainingRounds);
	readIfPresent(node, "epsilon", config.epsilon);
}

} // namespace

EngineConfig loadConfig(const std::string& path) {
	EngineConfig config{};

	try {
		cv::FileStorage fs(path, cv::FileStorage::READ);
		if (!fs.isOpened()) {
			throw PersistenceError("Could not open configuration file '" + path + "'.");
		}

		readPropagation(fs["propagation"], config.propagation);

		const cv::FileNode selection = fs["selection"];
		if (!selection.empty()) {
			readIfPresent(selection, "threshold", config.selection.threshold);
			int topK = static_cast<int>(config.selection.topK);
			readIfPresent(selection, "topK", topK);
			config.selection.topK = static_cast<std::size_t>(std::max(0, topK));
		}

		const cv::FileNode logging = fs["logging"];
		if (!logging.empty()) {
			readIfPresent(logging, "level", config.logging.level);
			readIfPresent(logging, "file", config.logging.file);
		}

		readIfPresent(fs.root(), "projectRoot", config.projectRoot);
	} catch (const cv::Exception& e) {
		throw PersistenceError("Could not parse configuration file '" + path + "': " + e.what());
	}

	return config;
}

} // namespace geolabel::classification::core
