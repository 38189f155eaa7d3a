#include "classification/session.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/logging.hpp"

#include <exception>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace geolabel::classification {

namespace {

//! Same segments with the same classes. Colours are not compared.
bool sameLabels(const std::vector<core::LabeledSegment>& a, const std::vector<core::LabeledSegment>& b) {
	std::map<core::SegmentId, std::string> lhs;
	for (const core::LabeledSegment& l: a) {
		lhs.emplace(l.id, l.className);
	}
	std::map<core::SegmentId, std::string> rhs;
	for (const core::LabeledSegment& l: b) {
		rhs.emplace(l.id, l.className);
	}
	return lhs == rhs;
}

} // namespace

std::string_view toString(const SessionState state) {
	switch (state) {
	case SessionState::Fresh:
		return "fresh";
	case SessionState::PartiallyLabeled:
		return "partially-labeled";
	case SessionState::Ready:
		return "ready";
	case SessionState::Propagated:
		return "propagated";
	}
	return "unknown";
}

ClassificationSession::ClassificationSession(std::shared_ptr<const core::FeatureTable> table, core::EngineConfig config)
    : m_table(std::move(table)), m_config(std::move(config)), m_engine(m_config.propagation), m_selector(m_config.selection), m_labels(m_table) {
	m_worker = std::thread([this]() { workerLoop(); });
}

ClassificationSession::~ClassificationSession() {
	disconnect();

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_stopping = true;
		if (m_cancelRunning) {
			m_cancelRunning->store(true);
		}
		if (m_queued) {
			m_queued->promise.set_exception(std::make_exception_ptr(core::PropagationCancelledError("Session closed before the propagation started.")));
			m_queued.reset();
		}
	}
	m_wake.notify_all();

	if (m_worker.joinable()) {
		m_worker.join();
	}
}

void ClassificationSession::connect(Callbacks callbacks) {
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	m_callbacks = std::move(callbacks);
}

void ClassificationSession::disconnect() {
	std::lock_guard<std::mutex> lock(m_callbackMutex);
	m_callbacks = {nullptr, nullptr};
}

// Persistence ---------------------------------------------------------------------------------------------------------------------------------------

void ClassificationSession::restore(const ProjectSnapshot& snapshot) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_inFlight || m_queued) {
		throw core::InvalidTransitionError("Cannot restore a session while a propagation is in flight.");
	}

	core::LabelStore labels(m_table);
	for (const core::ClassEntry& entry: snapshot.catalog) {
		labels.catalog().registerClass(entry.name, entry.color);
	}

	for (const SampleRecord& sample: snapshot.samples) {
		if (!m_table->contains(sample.id)) {
			core::logger()->warn("Skipping persisted sample of unknown segment {}.", sample.id);
			continue;
		}
		labels.setManual(sample.id, sample.className, sample.color, sample.analyst, sample.timestamp);
	}

	const PredictionSnapshot& predictions = snapshot.predictions;
	for (const PredictionRecord& rec: predictions.segments) {
		if (!m_table->contains(rec.id)) {
			core::logger()->warn("Skipping persisted prediction of unknown segment {}.", rec.id);
			continue;
		}

		core::PredictedLabel predicted{rec.label};
		for (std::size_t i = 0; i < predictions.classes.size() && i < rec.probabilities.size(); ++i) {
			predicted.probabilities[predictions.classes[i]] = rec.probabilities[i];
		}
		predicted.uncertainty = rec.uncertainty;
		labels.restorePrediction(rec.id, std::move(predicted));
	}

	m_labels     = std::move(labels);
	m_history    = snapshot.history;
	m_trainedOn  = predictions.trainedOn;
	m_propagated = !predictions.segments.empty() && sameLabels(m_trainedOn, m_labels.exportLabeled());
	m_lastTrace.clear();

	core::logger()->info("Restored session: {} classes, {} manual labels, {} predictions, {} runs. State {}.", m_labels.catalog().size(),
	                     m_labels.manualCount(), predictions.segments.size(), m_history.size(), toString(stateLocked()));
}

ProjectSnapshot ClassificationSession::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	ProjectSnapshot snap{};
	snap.catalog = m_labels.catalog().entries();
	snap.history = m_history;

	std::set<std::string> classes;
	for (const core::SegmentId id: m_table->ids()) {
		const core::LabelRecord& rec = m_labels.record(id);
		if (rec.manual) {
			snap.samples.push_back(
			        {id, rec.manual->className, m_labels.catalog().colorOf(rec.manual->className), rec.manual->analyst, rec.manual->timestamp});
		}
		if (rec.predicted) {
			for (const auto& [name, p]: rec.predicted->probabilities) {
				classes.insert(name);
			}
		}
	}

	PredictionSnapshot& predictions = snap.predictions;
	predictions.classes.assign(classes.begin(), classes.end());
	predictions.method    = m_history.empty() ? std::string{} : m_history.back().method;
	predictions.trainedOn = m_trainedOn;
	for (const core::SegmentId id: m_table->ids()) {
		const core::LabelRecord& rec = m_labels.record(id);
		if (!rec.predicted) {
			continue;
		}

		PredictionRecord out{id, rec.predicted->className};
		out.probabilities.reserve(predictions.classes.size());
		for (const std::string& name: predictions.classes) {
			const auto it = rec.predicted->probabilities.find(name);
			out.probabilities.push_back(it == rec.predicted->probabilities.end() ? 0.0 : it->second);
		}
		out.uncertainty = rec.predicted->uncertainty;
		predictions.segments.push_back(std::move(out));
	}

	return snap;
}

// Edits ---------------------------------------------------------------------------------------------------------------------------------------------

void ClassificationSession::validateLabel(const core::SegmentId id, std::string_view className) const {
	if (!m_table->contains(id)) {
		throw core::UnknownSegmentError("Segment " + std::to_string(id) + " is not part of the feature table.");
	}
	if (core::ClassCatalog::normalize(className).empty()) {
		throw core::InvalidClassError("Empty class name for segment " + std::to_string(id) + ".");
	}
}

void ClassificationSession::noteEditLocked(const SessionState before, const bool changed) {
	if (changed) {
		m_propagated = false;
	}

	const SessionState after = stateLocked();
	if (after != before) {
		core::logger()->info("Session state {} -> {}.", toString(before), toString(after));
	}
}

void ClassificationSession::submitLocked(Edit edit) {
	if (m_inFlight) {
		m_pendingEdits.push_back(std::move(edit));
		core::logger()->debug("Propagation in flight. Queued edit ({} pending).", m_pendingEdits.size());
		return;
	}

	const SessionState before = stateLocked();
	noteEditLocked(before, edit(m_labels));
}

void ClassificationSession::applyPendingLocked() {
	if (m_pendingEdits.empty()) {
		return;
	}

	const SessionState before = stateLocked();
	bool changed              = false;
	for (Edit& edit: m_pendingEdits) {
		changed = edit(m_labels) || changed;
	}
	core::logger()->debug("Applied {} queued edits.", m_pendingEdits.size());
	m_pendingEdits.clear();
	noteEditLocked(before, changed);
}

void ClassificationSession::applyManualLabels(const std::vector<ManualLabelRequest>& labels) {
	std::lock_guard<std::mutex> lock(m_mutex);
	for (const ManualLabelRequest& req: labels) {
		validateLabel(req.id, req.className);
	}
	if (labels.empty()) {
		return;
	}

	// An analyst-only update keeps the predictions current.
	submitLocked([labels](core::LabelStore& store) {
		bool changed = false;
		for (const ManualLabelRequest& req: labels) {
			const std::optional<core::ManualLabel>& manual = store.record(req.id).manual;
			changed = changed || !manual || manual->className != core::ClassCatalog::normalize(req.className);
			store.setManual(req.id, req.className, req.color, req.analyst);
		}
		return changed;
	});
}

void ClassificationSession::correctLabel(const core::SegmentId id, std::string_view className, std::string_view color, std::string_view analyst) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (stateLocked() != SessionState::Propagated && !m_inFlight) {
		throw core::InvalidTransitionError("Labels can only be corrected after propagation (state is " + std::string(toString(stateLocked())) + ").");
	}
	validateLabel(id, className);

	submitLocked([id, name = std::string(className), col = std::string(color), who = std::string(analyst)](core::LabelStore& store) {
		store.setManual(id, name, col, who);
		return true;
	});
}

bool ClassificationSession::clearManualLabel(const core::SegmentId id) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_table->contains(id)) {
		throw core::UnknownSegmentError("Segment " + std::to_string(id) + " is not part of the feature table.");
	}

	if (m_inFlight) {
		submitLocked([id](core::LabelStore& store) { return store.clearManual(id); });
		return false;
	}

	const SessionState before = stateLocked();
	const bool cleared        = m_labels.clearManual(id);
	noteEditLocked(before, cleared);
	return cleared;
}

std::size_t ClassificationSession::removeClass(std::string_view name) {
	std::lock_guard<std::mutex> lock(m_mutex);
	const std::string normalized = core::ClassCatalog::normalize(name);

	if (m_inFlight) {
		submitLocked([normalized](core::LabelStore& store) { return store.removeClass(normalized) > 0u; });
		return 0u;
	}

	const SessionState before = stateLocked();
	const std::size_t cleared = m_labels.removeClass(normalized);
	core::logger()->info("Removed class '{}', cleared {} manual labels.", normalized, cleared);
	noteEditLocked(before, cleared > 0u);
	return cleared;
}

// Propagation ---------------------------------------------------------------------------------------------------------------------------------------

std::future<PropagationRecord> ClassificationSession::runPropagationAsync(const core::PropagationMethod method) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_stopping) {
		throw core::InvalidTransitionError("Session is shutting down.");
	}

	if (!m_inFlight) {
		const std::size_t classes = m_labels.distinctManualClasses().size();
		if (classes < 2u) {
			throw core::InsufficientLabelsError("Propagation needs at least two labelled classes, found " + std::to_string(classes) + ".");
		}
	}

	// Last request wins.
	if (m_queued) {
		m_queued->promise.set_exception(std::make_exception_ptr(core::PropagationCancelledError("Superseded by a newer propagation request.")));
		m_queued.reset();
	}
	if (m_inFlight && m_cancelRunning) {
		m_cancelRunning->store(true);
		core::logger()->info("Cancelling running propagation in favour of '{}'.", core::toString(method));
	}

	Job job{method, std::promise<PropagationRecord>{}};
	std::future<PropagationRecord> future = job.promise.get_future();
	m_queued.emplace(std::move(job));
	m_wake.notify_one();
	return future;
}

PropagationRecord ClassificationSession::runPropagation(const core::PropagationMethod method) {
	return runPropagationAsync(method).get();
}

bool ClassificationSession::isPropagating() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_inFlight || m_queued.has_value();
}

void ClassificationSession::workerLoop() {
	while (true) {
		std::optional<Job> job;
		std::vector<core::LabeledSegment> labeled;
		std::shared_ptr<std::atomic<bool>> cancel;

		{
			std::unique_lock<std::mutex> lock(m_mutex);
			m_wake.wait(lock, [this]() { return m_stopping || m_queued.has_value(); });
			if (m_stopping) {
				return;
			}

			job.emplace(std::move(*m_queued));
			m_queued.reset();

			applyPendingLocked();
			labeled         = m_labels.exportLabeled();
			cancel          = std::make_shared<std::atomic<bool>>(false);
			m_cancelRunning = cancel;
			m_inFlight      = true;
		}

		process(std::move(*job), labeled, cancel);
	}
}

void ClassificationSession::process(Job job, const std::vector<core::LabeledSegment>& labeled, const std::shared_ptr<std::atomic<bool>>& cancel) {
	Callbacks callbacks;
	{
		std::lock_guard<std::mutex> lock(m_callbackMutex);
		callbacks = m_callbacks;
	}

	PropagationRecord record{std::string(core::toString(job.method))};
	std::exception_ptr failure;

	try {
		if (callbacks.onPropagationStarted) {
			callbacks.onPropagationStarted(job.method);
		}

		core::PropagationTrace trace;
		trace.setVerbose(core::logger()->should_log(spdlog::level::debug));
		const core::PropagationResult result = m_engine.propagate(job.method, *m_table, labeled, cancel.get(), &trace);

		std::lock_guard<std::mutex> lock(m_mutex);
		if (cancel->load()) {
			throw core::PropagationCancelledError("Propagation superseded before its result was applied.");
		}

		const SessionState before = stateLocked();
		m_labels.applyPropagationResult(result);
		m_propagated = true;

		record.trainingConsistency = result.trainingConsistency;
		record.labeledCount        = result.labeledCount;
		record.segmentCount        = m_table->size();
		record.classes             = result.classes;
		record.iterations          = result.iterations;
		record.converged           = result.converged;
		record.timestamp           = core::utcNow();
		m_history.push_back(record);
		m_trainedOn = labeled;
		m_lastTrace = trace.stages();

		core::logger()->info("Propagation '{}' applied: consistency {:.3f}, {} labelled of {} segments, {} classes. State {} -> {}.", record.method,
		                     record.trainingConsistency, record.labeledCount, record.segmentCount, record.classes.size(), toString(before),
		                     toString(stateLocked()));

		m_inFlight = false;
		m_cancelRunning.reset();
		applyPendingLocked();
	} catch (const core::PropagationCancelledError& e) {
		core::logger()->info("Propagation '{}' cancelled: {}", record.method, e.what());
		failure = std::current_exception();
	} catch (const core::Error& e) {
		core::logger()->warn("Propagation '{}' failed ({}): {}", record.method, core::toString(e.kind()), e.what());
		failure = std::current_exception();
	} catch (const std::exception& e) {
		core::logger()->error("Propagation '{}' failed: {}", record.method, e.what());
		failure = std::make_exception_ptr(core::InternalError("Propagation '" + record.method + "' failed: " + e.what()));
	}

	if (failure) {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_inFlight = false;
			m_cancelRunning.reset();
			applyPendingLocked();
		}
		job.promise.set_exception(failure);
		return;
	}

	job.promise.set_value(record);
	if (callbacks.onPropagationFinished) {
		try {
			callbacks.onPropagationFinished(record);
		} catch (const std::exception& e) {
			core::logger()->error("onPropagationFinished callback failed: {}", e.what());
		}
	}
}

// Reads ---------------------------------------------------------------------------------------------------------------------------------------------

SessionState ClassificationSession::stateLocked() const {
	if (m_labels.manualCount() == 0u) {
		return SessionState::Fresh;
	}
	if (m_labels.distinctManualClasses().size() < 2u) {
		return SessionState::PartiallyLabeled;
	}
	return m_propagated ? SessionState::Propagated : SessionState::Ready;
}

SessionState ClassificationSession::state() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return stateLocked();
}

SegmentView ClassificationSession::viewLocked(const std::size_t row) const {
	const core::SegmentId id     = m_table->ids()[row];
	const core::LabelRecord& rec = m_labels.record(id);

	SegmentView view{id, m_table->geometry(row)};
	if (rec.manual) {
		view.manualLabel = rec.manual->className;
	}
	if (rec.predicted) {
		view.predictedLabel = rec.predicted->className;
		view.uncertainty    = rec.predicted->uncertainty;
		view.probabilities  = rec.predicted->probabilities;
	}
	view.displayLabel = m_labels.displayLabel(id);
	view.origin       = m_labels.origin(id);
	view.color        = m_labels.displayColor(id);
	return view;
}

std::vector<SegmentView> ClassificationSession::segments() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	std::vector<SegmentView> views;
	views.reserve(m_table->size());
	for (std::size_t row = 0; row < m_table->size(); ++row) {
		views.push_back(viewLocked(row));
	}
	return views;
}

SegmentView ClassificationSession::segment(const core::SegmentId id) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return viewLocked(m_table->rowOf(id));
}

std::vector<core::ClassEntry> ClassificationSession::catalog() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_labels.catalog().entries();
}

std::vector<core::LabeledSegment> ClassificationSession::labeled() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_labels.exportLabeled();
}

std::vector<PropagationRecord> ClassificationSession::history() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_history;
}

std::vector<core::TraceStage> ClassificationSession::lastTrace() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_lastTrace;
}

std::vector<core::RankedSegment> ClassificationSession::ranking() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_selector.rank(m_labels);
}

std::vector<core::SegmentId> ClassificationSession::selectForReview(const double threshold, const std::size_t topK) const {
	return core::UncertaintySelector::select(ranking(), threshold, topK);
}

std::vector<core::SegmentId> ClassificationSession::selectForReview() const {
	return m_selector.select(ranking());
}

} // namespace geolabel::classification
