#include "classification/projectStore.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/logging.hpp"
#include "classification/retry.hpp"

#include <opencv2/core/persistence.hpp>

#include <algorithm>
#include <atomic>
#include <system_error>
#include <utility>

namespace geolabel::classification {

namespace fs = std::filesystem;

namespace {

cv::FileStorage openRead(const fs::path& path) {
	cv::FileStorage storage(path.string(), cv::FileStorage::READ);
	if (!storage.isOpened()) {
		throw core::PersistenceError("Could not open '" + path.string() + "' for reading.");
	}
	return storage;
}

//! Sibling of target that no concurrent writer in this process uses.
fs::path temporaryFor(const fs::path& target) {
	static std::atomic<unsigned> counter{0u};
	return target.parent_path() / (target.stem().string() + ".tmp" + std::to_string(counter.fetch_add(1u)) + target.extension().string());
}

//! Write into a temporary sibling file, then replace the target. Readers never see a partial file.
template<typename WriteFn>
void writeAtomic(const fs::path& target, WriteFn&& write) {
	const fs::path tmp = temporaryFor(target);

	try {
		cv::FileStorage storage(tmp.string(), cv::FileStorage::WRITE);
		if (!storage.isOpened()) {
			throw core::PersistenceError("Could not open '" + tmp.string() + "' for writing.");
		}
		write(storage);
		storage.release();
	} catch (const cv::Exception& e) {
		throw core::PersistenceError("Could not write '" + target.string() + "': " + e.what());
	}

	std::error_code ec;
	fs::rename(tmp, target, ec);
	if (ec) {
		std::error_code ignored;
		fs::remove(tmp, ignored);
		throw core::PersistenceError("Could not replace '" + target.string() + "': " + ec.message());
	}
}

bool isFile(const fs::path& path) {
	std::error_code ec;
	return fs::is_regular_file(path, ec);
}

std::string readString(const cv::FileNode& node, const char* key) {
	std::string value;
	const cv::FileNode child = node[key];
	if (!child.empty()) {
		child >> value;
	}
	return value;
}

} // namespace

ProjectStore::ProjectStore(fs::path root) : m_root(std::move(root)) {
}

fs::path ProjectStore::projectDir(std::string_view projectId) const {
	if (projectId.empty() || projectId == "." || projectId == ".." || projectId.find_first_of("/\\") != std::string_view::npos) {
		throw core::UnknownProjectError("Invalid project id '" + std::string(projectId) + "'.");
	}
	return m_root / fs::path(std::string(projectId));
}

bool ProjectStore::exists(std::string_view projectId) const {
	return isFile(projectDir(projectId) / FEATURES_FILE);
}

std::vector<std::string> ProjectStore::projects() const {
	std::vector<std::string> ids;
	std::error_code ec;
	if (!fs::is_directory(m_root, ec)) {
		return ids;
	}

	for (const fs::directory_entry& entry: fs::directory_iterator(m_root, ec)) {
		if (entry.is_directory() && isFile(entry.path() / FEATURES_FILE)) {
			ids.push_back(entry.path().filename().string());
		}
	}
	if (ec) {
		throw core::PersistenceError("Could not list projects in '" + m_root.string() + "': " + ec.message());
	}

	std::sort(ids.begin(), ids.end());
	return ids;
}

void ProjectStore::createProject(std::string_view projectId, const core::FeatureTable& table) const {
	const fs::path dir = projectDir(projectId);

	std::error_code ec;
	fs::create_directories(dir, ec);
	if (ec) {
		throw core::PersistenceError("Could not create project directory '" + dir.string() + "': " + ec.message());
	}

	const fs::path target = dir / FEATURES_FILE;
	retryOnce(target.string(), [&]() {
		const fs::path tmp = temporaryFor(target);
		table.save(tmp.string());

		std::error_code renameError;
		fs::rename(tmp, target, renameError);
		if (renameError) {
			throw core::PersistenceError("Could not replace '" + target.string() + "': " + renameError.message());
		}
	});
	core::logger()->info("Created project '{}' with {} segments and {} features.", projectId, table.size(), table.dimension());
}

core::FeatureTable ProjectStore::loadFeatures(std::string_view projectId) const {
	const fs::path path = projectDir(projectId) / FEATURES_FILE;
	if (!isFile(path)) {
		throw core::UnknownProjectError("Project '" + std::string(projectId) + "' does not exist (no " + std::string(FEATURES_FILE) + ").");
	}
	return retryOnce(path.string(), [&]() { return core::FeatureTable::load(path.string()); });
}

ProjectSnapshot ProjectStore::load(std::string_view projectId) const {
	ProjectSnapshot snapshot{};
	snapshot.catalog     = loadCatalog(projectId);
	snapshot.samples     = loadSamples(projectId);
	snapshot.predictions = loadPredictions(projectId);
	snapshot.history     = loadHistory(projectId);
	return snapshot;
}

// Samples -------------------------------------------------------------------------------------------------------------------------------------------

std::vector<SampleRecord> ProjectStore::loadSamples(std::string_view projectId) const {
	const fs::path path = projectDir(projectId) / SAMPLES_FILE;
	if (!isFile(path)) {
		return {};
	}

	return retryOnce(path.string(), [&]() {
		std::vector<SampleRecord> samples;
		try {
			cv::FileStorage storage = openRead(path);
			for (const cv::FileNode& node: storage["samples"]) {
				SampleRecord rec{static_cast<core::SegmentId>(static_cast<int>(node["id"])), readString(node, "className"), readString(node, "color")};
				rec.analyst   = readString(node, "analyst");
				rec.timestamp = readString(node, "timestamp");
				samples.push_back(std::move(rec));
			}
		} catch (const cv::Exception& e) {
			throw core::PersistenceError("Could not parse '" + path.string() + "': " + e.what());
		}
		return samples;
	});
}

void ProjectStore::saveSamples(std::string_view projectId, const std::vector<SampleRecord>& samples) const {
	const fs::path path = projectDir(projectId) / SAMPLES_FILE;
	retryOnce(path.string(), [&]() {
		writeAtomic(path, [&](cv::FileStorage& storage) {
			storage << "samples" << "[";
			for (const SampleRecord& rec: samples) {
				storage << "{";
				storage << "id" << static_cast<int>(rec.id);
				storage << "className" << rec.className;
				storage << "color" << rec.color;
				if (!rec.analyst.empty()) {
					storage << "analyst" << rec.analyst;
				}
				if (!rec.timestamp.empty()) {
					storage << "timestamp" << rec.timestamp;
				}
				storage << "}";
			}
			storage << "]";
		});
	});
	core::logger()->debug("Saved {} samples to '{}'.", samples.size(), path.string());
}

// Catalog -------------------------------------------------------------------------------------------------------------------------------------------

std::vector<core::ClassEntry> ProjectStore::loadCatalog(std::string_view projectId) const {
	const fs::path path = projectDir(projectId) / CATALOG_FILE;
	if (!isFile(path)) {
		return {};
	}

	return retryOnce(path.string(), [&]() {
		std::vector<core::ClassEntry> entries;
		try {
			cv::FileStorage storage = openRead(path);
			for (const cv::FileNode& node: storage["classes"]) {
				entries.push_back({readString(node, "name"), readString(node, "color")});
			}
		} catch (const cv::Exception& e) {
			throw core::PersistenceError("Could not parse '" + path.string() + "': " + e.what());
		}
		return entries;
	});
}

void ProjectStore::saveCatalog(std::string_view projectId, const std::vector<core::ClassEntry>& catalog) const {
	const fs::path path = projectDir(projectId) / CATALOG_FILE;
	retryOnce(path.string(), [&]() {
		writeAtomic(path, [&](cv::FileStorage& storage) {
			storage << "classes" << "[";
			for (const core::ClassEntry& entry: catalog) {
				storage << "{" << "name" << entry.name << "color" << entry.color << "}";
			}
			storage << "]";
		});
	});
}

// Predictions ---------------------------------------------------------------------------------------------------------------------------------------

PredictionSnapshot ProjectStore::loadPredictions(std::string_view projectId) const {
	const fs::path path = projectDir(projectId) / PREDICTIONS_FILE;
	if (!isFile(path)) {
		return {};
	}

	return retryOnce(path.string(), [&]() {
		PredictionSnapshot snapshot{};
		try {
			cv::FileStorage storage = openRead(path);
			snapshot.method = readString(storage.root(), "method");
			storage["classes"] >> snapshot.classes;

			for (const cv::FileNode& node: storage["segments"]) {
				PredictionRecord rec{static_cast<core::SegmentId>(static_cast<int>(node["id"])), readString(node, "label")};
				node["probabilities"] >> rec.probabilities;
				rec.uncertainty = static_cast<double>(node["uncertainty"]);
				if (rec.probabilities.size() != snapshot.classes.size()) {
					throw core::PersistenceError("'" + path.string() + "': segment " + std::to_string(rec.id) + " has " +
					                             std::to_string(rec.probabilities.size()) + " probabilities for " +
					                             std::to_string(snapshot.classes.size()) + " classes.");
				}
				snapshot.segments.push_back(std::move(rec));
			}
			for (const cv::FileNode& node: storage["trainedOn"]) {
				snapshot.trainedOn.push_back({static_cast<core::SegmentId>(static_cast<int>(node["id"])), readString(node, "className"), {}});
			}
		} catch (const cv::Exception& e) {
			throw core::PersistenceError("Could not parse '" + path.string() + "': " + e.what());
		}
		return snapshot;
	});
}

void ProjectStore::savePredictions(std::string_view projectId, const PredictionSnapshot& predictions) const {
	const fs::path path = projectDir(projectId) / PREDICTIONS_FILE;
	retryOnce(path.string(), [&]() {
		writeAtomic(path, [&](cv::FileStorage& storage) {
			storage << "method" << predictions.method;
			storage << "classes" << predictions.classes;
			storage << "segments" << "[";
			for (const PredictionRecord& rec: predictions.segments) {
				storage << "{";
				storage << "id" << static_cast<int>(rec.id);
				storage << "label" << rec.label;
				storage << "uncertainty" << rec.uncertainty;
				storage << "probabilities" << rec.probabilities;
				storage << "}";
			}
			storage << "]";
			storage << "trainedOn" << "[";
			for (const core::LabeledSegment& label: predictions.trainedOn) {
				storage << "{" << "id" << static_cast<int>(label.id) << "className" << label.className << "}";
			}
			storage << "]";
		});
	});
	core::logger()->debug("Saved {} predictions to '{}'.", predictions.segments.size(), path.string());
}

// History -------------------------------------------------------------------------------------------------------------------------------------------

std::vector<PropagationRecord> ProjectStore::loadHistory(std::string_view projectId) const {
	const fs::path path = projectDir(projectId) / HISTORY_FILE;
	if (!isFile(path)) {
		return {};
	}

	return retryOnce(path.string(), [&]() {
		std::vector<PropagationRecord> history;
		try {
			cv::FileStorage storage = openRead(path);
			for (const cv::FileNode& node: storage["runs"]) {
				PropagationRecord rec{readString(node, "method")};
				rec.trainingConsistency = static_cast<double>(node["trainingConsistency"]);
				rec.labeledCount        = static_cast<std::size_t>(static_cast<int>(node["labeledCount"]));
				rec.segmentCount        = static_cast<std::size_t>(static_cast<int>(node["segmentCount"]));
				node["classes"] >> rec.classes;
				rec.iterations = static_cast<unsigned>(static_cast<int>(node["iterations"]));
				rec.converged  = static_cast<int>(node["converged"]) != 0;
				rec.timestamp  = readString(node, "timestamp");
				history.push_back(std::move(rec));
			}
		} catch (const cv::Exception& e) {
			throw core::PersistenceError("Could not parse '" + path.string() + "': " + e.what());
		}
		return history;
	});
}

void ProjectStore::saveHistory(std::string_view projectId, const std::vector<PropagationRecord>& history) const {
	const fs::path path = projectDir(projectId) / HISTORY_FILE;
	retryOnce(path.string(), [&]() {
		writeAtomic(path, [&](cv::FileStorage& storage) {
			storage << "runs" << "[";
			for (const PropagationRecord& rec: history) {
				storage << "{";
				storage << "method" << rec.method;
				storage << "trainingConsistency" << rec.trainingConsistency;
				storage << "labeledCount" << static_cast<int>(rec.labeledCount);
				storage << "segmentCount" << static_cast<int>(rec.segmentCount);
				storage << "classes" << rec.classes;
				storage << "iterations" << static_cast<int>(rec.iterations);
				storage << "converged" << (rec.converged ? 1 : 0);
				storage << "timestamp" << rec.timestamp;
				storage << "}";
			}
			storage << "]";
		});
	});
}

} // namespace geolabel::classification
