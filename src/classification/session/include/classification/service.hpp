#pragma once

#include "classification/core/config.hpp"
#include "classification/core/uncertainty.hpp"
#include "classification/projectStore.hpp"
#include "classification/session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geolabel::classification {

//! Outcome of a service call. On failure errorKind holds the stable error name (e.g. "InsufficientLabelsError").
struct Status {
	bool ok{true};
	std::string errorKind{};
	std::string message{};
};

struct SegmentPrediction {
	core::SegmentId id;
	std::string label;       //!< Predicted label (manual labels do not hide it here).
	double uncertainty{0.0};
};

struct PropagateResponse {
	Status status{};
	std::string method{};
	double trainingConsistency{0.0};
	std::size_t totalSegments{0u};
	std::size_t labeledSegments{0u};
	std::vector<std::string> classes{};
	std::vector<SegmentPrediction> predictions{};
};

struct SaveResponse {
	Status status{};
	bool changed{false}; //!< False when the overlay was already stored. Nothing is written then.
	std::size_t created{0u};
	std::size_t updated{0u};
	std::size_t removed{0u};
};

struct ClassificationResult {
	Status status{};
	SessionState state{SessionState::Fresh};
	std::vector<SegmentView> segments{};
	std::vector<core::ClassEntry> classes{};
	std::optional<PropagationRecord> lastRun{};
};

struct ReviewResponse {
	Status status{};
	std::vector<core::RankedSegment> segments{}; //!< Selected for review, most uncertain first.
};

/*! Boundary operations keyed by project id.
 *  Sessions are opened lazily from the ProjectStore and kept until close(). Every mutating call persists the affected artifacts.
 *  Mutating calls (propagate, saveLabels, removeClass) on one project run one at a time, each with its writes. A saveLabels issued while a
 *  propagation runs waits for it and applies on top of its result. Reads do not wait.
 *  Errors never escape: they are reported through Status. Failures outside the core::Error hierarchy are reported as "InternalError".
 */
class ClassificationService {
public:
	explicit ClassificationService(core::EngineConfig config = core::EngineConfig{});
	ClassificationService(ProjectStore store, core::EngineConfig config);

	const ProjectStore& store() const {
		return m_store;
	}

	//! Session of a project. Loads the persisted state on first access. Throws UnknownProjectError, PersistenceError.
	std::shared_ptr<ClassificationSession> open(std::string_view projectId);
	void close(std::string_view projectId);
	bool isOpen(std::string_view projectId) const;

	//! Run a propagation method and persist predictions, history, samples and catalog.
	PropagateResponse propagate(std::string_view projectId, std::string_view method);

	/*! Replace the manual overlay of a project and persist samples and catalog.
	 *  Segments missing from labels lose their manual label. Duplicated ids: the last entry wins.
	 *  A label counts as updated when its class changes, or when the request names a different analyst.
	 *  Saving the stored overlay again changes nothing and writes nothing.
	 */
	SaveResponse saveLabels(std::string_view projectId, const std::vector<ManualLabelRequest>& labels);

	//! Per segment geometry, labels, colour and uncertainty.
	ClassificationResult getClassificationResult(std::string_view projectId);

	//! Delete a class. Manual labels using it are cleared, predictions stay.
	SaveResponse removeClass(std::string_view projectId, std::string_view className);

	//! Unlabelled segments with uncertainty >= threshold, at most topK.
	ReviewResponse review(std::string_view projectId, double threshold, std::size_t topK);
	ReviewResponse review(std::string_view projectId); //!< With the configured threshold and topK.

private:
	void persistLabels(std::string_view projectId, const ClassificationSession& session) const;
	void persistAll(std::string_view projectId, const ClassificationSession& session) const;
	std::shared_ptr<std::mutex> writerOf(std::string_view projectId); //!< Writer lock of a project. Created on first use, never removed.

private:
	ProjectStore m_store;
	core::EngineConfig m_config;

	mutable std::mutex m_mutex; //!< Guards m_sessions and m_writers.
	std::map<std::string, std::shared_ptr<ClassificationSession>, std::less<>> m_sessions{};
	std::map<std::string, std::shared_ptr<std::mutex>, std::less<>> m_writers{};
};

} // namespace geolabel::classification
