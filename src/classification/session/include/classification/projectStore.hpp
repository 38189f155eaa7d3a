#pragma once

#include "classification/core/classCatalog.hpp"
#include "classification/core/featureTable.hpp"
#include "classification/core/labelStore.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace geolabel::classification {

//! Manual label as persisted in the samples file.
struct SampleRecord {
	core::SegmentId id;
	std::string className;
	std::string color;
	std::string analyst{};
	std::string timestamp{};
};

struct PredictionRecord {
	core::SegmentId id;
	std::string label;
	std::vector<double> probabilities{}; //!< Aligned to PredictionSnapshot::classes.
	double uncertainty{0.0};
};

//! Content of the predictions file: the last successful propagation.
struct PredictionSnapshot {
	std::string method{};
	std::vector<std::string> classes{};
	std::vector<PredictionRecord> segments{};
	std::vector<core::LabeledSegment> trainedOn{}; //!< Manual labels (id, class) the predictions were computed from.
};

//! One entry of the propagation history.
struct PropagationRecord {
	std::string method;
	double trainingConsistency{0.0};
	std::size_t labeledCount{0u};
	std::size_t segmentCount{0u};
	std::vector<std::string> classes{};
	unsigned iterations{0u};
	bool converged{false};
	std::string timestamp{};
};

//! Everything persisted for a project besides the feature table.
struct ProjectSnapshot {
	std::vector<core::ClassEntry> catalog{};
	std::vector<SampleRecord> samples{};
	PredictionSnapshot predictions{};
	std::vector<PropagationRecord> history{};
};

/*! File based persistence. One directory per project below root:
 *    features.yml     Segment/feature table (input from the segmentation step).
 *    samples.json     Manual labels with colours.
 *    predictions.json Predicted label, probabilities and uncertainty per segment.
 *    catalog.json     Class name -> colour. Keeps colours stable across sessions.
 *    history.json     Propagation runs.
 *  Writes go to a temporary file which then replaces the target. Every read and write is retried once before a PersistenceError is raised.
 *  Missing artifact files read as empty.
 */
class ProjectStore {
public:
	static constexpr std::string_view FEATURES_FILE    = "features.yml";
	static constexpr std::string_view SAMPLES_FILE     = "samples.json";
	static constexpr std::string_view PREDICTIONS_FILE = "predictions.json";
	static constexpr std::string_view CATALOG_FILE     = "catalog.json";
	static constexpr std::string_view HISTORY_FILE     = "history.json";

	explicit ProjectStore(std::filesystem::path root);

	const std::filesystem::path& root() const {
		return m_root;
	}

	//! Directory of a project. Throws UnknownProjectError for empty ids or ids containing path separators.
	std::filesystem::path projectDir(std::string_view projectId) const;
	bool exists(std::string_view projectId) const; //!< A feature table is present.
	std::vector<std::string> projects() const;     //!< Ids of all existing projects, sorted.

	//! Create the project directory and store its feature table.
	void createProject(std::string_view projectId, const core::FeatureTable& table) const;
	core::FeatureTable loadFeatures(std::string_view projectId) const; //!< Throws UnknownProjectError if absent.

	ProjectSnapshot load(std::string_view projectId) const;

	std::vector<SampleRecord> loadSamples(std::string_view projectId) const;
	void saveSamples(std::string_view projectId, const std::vector<SampleRecord>& samples) const;

	std::vector<core::ClassEntry> loadCatalog(std::string_view projectId) const;
	void saveCatalog(std::string_view projectId, const std::vector<core::ClassEntry>& catalog) const;

	PredictionSnapshot loadPredictions(std::string_view projectId) const;
	void savePredictions(std::string_view projectId, const PredictionSnapshot& predictions) const;

	std::vector<PropagationRecord> loadHistory(std::string_view projectId) const;
	void saveHistory(std::string_view projectId, const std::vector<PropagationRecord>& history) const;

private:
	std::filesystem::path m_root;
};

} // namespace geolabel::classification
