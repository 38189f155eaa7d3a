#pragma once

#include "classification/core/config.hpp"
#include "classification/core/featureTable.hpp"
#include "classification/core/labelStore.hpp"
#include "classification/core/propagation.hpp"
#include "classification/core/propagationTrace.hpp"
#include "classification/core/uncertainty.hpp"
#include "classification/projectStore.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace geolabel::classification {

//! Position in the active learning cycle. There is no terminal state.
enum class SessionState {
	Fresh,            //!< No manual label.
	PartiallyLabeled, //!< Manual labels of a single class.
	Ready,            //!< At least two labelled classes. Propagation possible.
	Propagated,       //!< Predictions reflect the current manual labels.
};

std::string_view toString(SessionState state);

struct ManualLabelRequest {
	core::SegmentId id;
	std::string className;
	std::string color{};   //!< Used if the class is new. Empty -> fallback colour.
	std::string analyst{};
};

//! Display view of one segment.
struct SegmentView {
	core::SegmentId id;
	std::string geometry;                          //!< Passed through from the feature table.
	std::optional<std::string> manualLabel{};
	std::optional<std::string> predictedLabel{};   //!< Kept even while hidden by a manual label.
	std::optional<std::string> displayLabel{};
	core::LabelOrigin origin{core::LabelOrigin::None};
	std::string color{};
	std::optional<double> uncertainty{};
	std::map<std::string, double> probabilities{};
};

/*! Orchestrates the labelling / propagation cycle of one project.
 *  Process: The user
 *   - Restores persisted state (optional) and labels a few segments manually.
 *   - Connects callback functions to be notified when propagation starts and finishes.
 *   - Calls runPropagationAsync() once at least two classes are labelled. The computation runs on the session worker thread.
 *   - Inspects segments(), ranking() and selectForReview() and corrects labels. Then propagates again.
 *
 *  One propagation is in flight at a time. A newer request supersedes the running and queued ones (their futures fail with PropagationCancelledError).
 *  Edits made while a propagation runs are queued and applied once it completes, before the next one starts.
 *  Reads never wait for a running computation.
 *  Failures other than core::Error reach the future as InternalError.
 */
class ClassificationSession {
public:
	struct Callbacks {
		std::function<void(core::PropagationMethod)> onPropagationStarted;        //!< Called on the worker thread before computing. An exception fails the job.
		std::function<void(const PropagationRecord&)> onPropagationFinished;      //!< Called on the worker thread after a successful run.
	};

public:
	explicit ClassificationSession(std::shared_ptr<const core::FeatureTable> table, core::EngineConfig config = core::EngineConfig{});
	~ClassificationSession();

	ClassificationSession(const ClassificationSession&)            = delete;
	ClassificationSession& operator=(const ClassificationSession&) = delete;

	//! Load persisted catalog, samples, predictions and history. Throws InvalidTransitionError while a propagation is in flight.
	void restore(const ProjectSnapshot& snapshot);
	ProjectSnapshot snapshot() const; //!< Current state in persisted form.

	void connect(Callbacks callbacks); //!< Connect callback functions.
	void disconnect();                 //!< Disconnect the callback functions.

	/*! Label segments manually. The batch is validated as a whole before anything changes.
	 * \throws UnknownSegmentError, InvalidClassError.
	 */
	void applyManualLabels(const std::vector<ManualLabelRequest>& labels);

	//! Replace the label of a segment after reviewing predictions. Valid in Propagated (or while a propagation is in flight). Demotes to Ready.
	//! \throws InvalidTransitionError, UnknownSegmentError, InvalidClassError.
	void correctLabel(core::SegmentId id, std::string_view className, std::string_view color = {}, std::string_view analyst = {});

	//! Remove the manual label of a segment. Returns false if it had none (or the edit was queued).
	bool clearManualLabel(core::SegmentId id);

	//! Delete a class from the catalog. Manual labels using it are cleared, predictions stay. Returns the number of cleared labels (0 when queued).
	std::size_t removeClass(std::string_view name);

	/*! Start propagation on the worker thread.
	 * \return  Future of the history record appended on success.
	 * \throws  InsufficientLabelsError immediately if nothing is in flight and fewer than two classes are labelled.
	 *          Otherwise the precondition is checked once the queued edits have been applied and reported through the future.
	 */
	std::future<PropagationRecord> runPropagationAsync(core::PropagationMethod method);
	PropagationRecord runPropagation(core::PropagationMethod method); //!< Blocking version of runPropagationAsync().
	bool isPropagating() const;

	SessionState state() const;
	std::vector<SegmentView> segments() const;
	SegmentView segment(core::SegmentId id) const; //!< Throws UnknownSegmentError.
	std::vector<core::ClassEntry> catalog() const;
	std::vector<core::LabeledSegment> labeled() const;
	std::vector<PropagationRecord> history() const;
	std::vector<core::TraceStage> lastTrace() const; //!< Diagnostics of the last completed propagation.

	std::vector<core::RankedSegment> ranking() const; //!< Unlabelled segments by descending uncertainty.
	std::vector<core::SegmentId> selectForReview(double threshold, std::size_t topK) const;
	std::vector<core::SegmentId> selectForReview() const; //!< With the configured threshold and topK.

	const core::FeatureTable& table() const {
		return *m_table;
	}

private:
	using Edit = std::function<bool(core::LabelStore&)>; //!< Returns true if manual labels changed.

	struct Job {
		core::PropagationMethod method;
		std::promise<PropagationRecord> promise;
	};

	void workerLoop();
	void process(Job job, const std::vector<core::LabeledSegment>& labeled, const std::shared_ptr<std::atomic<bool>>& cancel);

	SessionState stateLocked() const;
	void submitLocked(Edit edit);                           //!< Apply now or queue while a propagation is in flight.
	void applyPendingLocked();                              //!< Apply queued edits in submission order.
	void noteEditLocked(SessionState before, bool changed); //!< Demote and log the transition.
	void validateLabel(core::SegmentId id, std::string_view className) const;
	SegmentView viewLocked(std::size_t row) const;

private:
	std::shared_ptr<const core::FeatureTable> m_table; //!< Shared read-only.
	core::EngineConfig m_config;
	core::PropagationEngine m_engine;
	core::UncertaintySelector m_selector;

	mutable std::mutex m_mutex;      //!< Guards everything below except the callbacks.
	std::condition_variable m_wake;  //!< Signals the worker on new jobs and shutdown.
	core::LabelStore m_labels;
	bool m_propagated{false};        //!< Predictions reflect the current manual labels.
	std::vector<PropagationRecord> m_history{};
	std::vector<core::LabeledSegment> m_trainedOn{}; //!< Training set of the current predictions.
	std::vector<core::TraceStage> m_lastTrace{};
	std::vector<Edit> m_pendingEdits{};
	std::optional<Job> m_queued{};
	bool m_inFlight{false};
	std::shared_ptr<std::atomic<bool>> m_cancelRunning{}; //!< Cancellation flag of the running job.
	bool m_stopping{false};

	std::mutex m_callbackMutex;
	Callbacks m_callbacks{};

	std::thread m_worker; //!< Runs propagation jobs. Started last, joined in the destructor.
};

} // namespace geolabel::classification
