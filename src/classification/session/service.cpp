#include "classification/service.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/logging.hpp"
#include "classification/core/propagation.hpp"

#include <cstddef>
#include <exception>
#include <map>
#include <string>
#include <utility>

namespace geolabel::classification {

namespace {

Status failed(std::string_view operation, std::string_view projectId, const core::Error& e) {
	core::logger()->warn("{} on project '{}' failed ({}): {}", operation, projectId, core::toString(e.kind()), e.what());
	return Status{false, std::string(core::toString(e.kind())), e.what()};
}

//! Anything that is not a core::Error (OpenCV, allocation) is reported as InternalError.
Status failed(std::string_view operation, std::string_view projectId, const std::exception& e) {
	core::logger()->error("{} on project '{}' failed unexpectedly: {}", operation, projectId, e.what());
	return Status{false, std::string(core::toString(core::ErrorKind::Internal)), e.what()};
}

} // namespace

ClassificationService::ClassificationService(core::EngineConfig config) : m_store(config.projectRoot), m_config(std::move(config)) {
}

ClassificationService::ClassificationService(ProjectStore store, core::EngineConfig config) : m_store(std::move(store)), m_config(std::move(config)) {
}

std::shared_ptr<ClassificationSession> ClassificationService::open(std::string_view projectId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (const auto it = m_sessions.find(projectId); it != m_sessions.end()) {
		return it->second;
	}

	auto table   = std::make_shared<const core::FeatureTable>(m_store.loadFeatures(projectId));
	auto session = std::make_shared<ClassificationSession>(table, m_config);
	session->restore(m_store.load(projectId));

	m_sessions.emplace(std::string(projectId), session);
	core::logger()->info("Opened project '{}' ({} segments, state {}).", projectId, table->size(), toString(session->state()));
	return session;
}

void ClassificationService::close(std::string_view projectId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (const auto it = m_sessions.find(projectId); it != m_sessions.end()) {
		m_sessions.erase(it);
		core::logger()->info("Closed project '{}'.", projectId);
	}
}

std::shared_ptr<std::mutex> ClassificationService::writerOf(std::string_view projectId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	auto it = m_writers.find(projectId);
	if (it == m_writers.end()) {
		it = m_writers.emplace(std::string(projectId), std::make_shared<std::mutex>()).first;
	}
	return it->second;
}

bool ClassificationService::isOpen(std::string_view projectId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.find(projectId) != m_sessions.end();
}

void ClassificationService::persistLabels(std::string_view projectId, const ClassificationSession& session) const {
	const ProjectSnapshot snap = session.snapshot();
	m_store.saveCatalog(projectId, snap.catalog);
	m_store.saveSamples(projectId, snap.samples);
}

void ClassificationService::persistAll(std::string_view projectId, const ClassificationSession& session) const {
	const ProjectSnapshot snap = session.snapshot();
	m_store.saveCatalog(projectId, snap.catalog);
	m_store.saveSamples(projectId, snap.samples);
	m_store.savePredictions(projectId, snap.predictions);
	m_store.saveHistory(projectId, snap.history);
}

PropagateResponse ClassificationService::propagate(std::string_view projectId, std::string_view method) {
	PropagateResponse response{};
	try {
		const core::PropagationMethod parsed = core::parseMethod(method);
		const auto session                   = open(projectId);
		const auto writer                    = writerOf(projectId);
		std::lock_guard<std::mutex> lock(*writer);

		const PropagationRecord record = session->runPropagation(parsed);
		persistAll(projectId, *session);

		response.method              = record.method;
		response.trainingConsistency = record.trainingConsistency;
		response.totalSegments       = record.segmentCount;
		response.labeledSegments     = record.labeledCount;
		response.classes             = record.classes;

		for (const SegmentView& view: session->segments()) {
			response.predictions.push_back({view.id, view.predictedLabel.value_or(std::string{}), view.uncertainty.value_or(0.0)});
		}
	} catch (const core::Error& e) {
		response.status = failed("propagate", projectId, e);
	} catch (const std::exception& e) {
		response.status = failed("propagate", projectId, e);
	}
	return response;
}

SaveResponse ClassificationService::saveLabels(std::string_view projectId, const std::vector<ManualLabelRequest>& labels) {
	SaveResponse response{};
	try {
		const auto session = open(projectId);
		const auto writer  = writerOf(projectId);
		std::lock_guard<std::mutex> lock(*writer);

		std::map<core::SegmentId, ManualLabelRequest> desired;
		for (const ManualLabelRequest& req: labels) {
			if (!session->table().contains(req.id)) {
				throw core::UnknownSegmentError("Segment " + std::to_string(req.id) + " is not part of project '" + std::string(projectId) + "'.");
			}
			ManualLabelRequest normalized = req;
			normalized.className          = core::ClassCatalog::normalize(req.className);
			if (normalized.className.empty()) {
				throw core::InvalidClassError("Empty class name for segment " + std::to_string(req.id) + ".");
			}
			desired.insert_or_assign(req.id, std::move(normalized));
		}

		ProjectSnapshot stored = session->snapshot();
		std::map<core::SegmentId, SampleRecord> current;
		for (SampleRecord& sample: stored.samples) {
			current.emplace(sample.id, std::move(sample));
		}

		// An empty analyst in the request keeps the stored one.
		std::vector<ManualLabelRequest> upserts;
		for (const auto& [id, req]: desired) {
			const auto it = current.find(id);
			if (it == current.end()) {
				++response.created;
				upserts.push_back(req);
			} else if (it->second.className != req.className || (!req.analyst.empty() && it->second.analyst != req.analyst)) {
				++response.updated;
				upserts.push_back(req);
			}
		}

		std::vector<core::SegmentId> removals;
		for (const auto& [id, sample]: current) {
			if (desired.find(id) == desired.end()) {
				removals.push_back(id);
			}
		}
		response.removed = removals.size();

		response.changed = response.created + response.updated + response.removed > 0u;
		if (!response.changed) {
			core::logger()->debug("saveLabels on project '{}': overlay unchanged.", projectId);
			return response;
		}

		for (const core::SegmentId id: removals) {
			session->clearManualLabel(id);
		}
		session->applyManualLabels(upserts);
		persistLabels(projectId, *session);

		core::logger()->info("Saved labels of project '{}': {} created, {} updated, {} removed.", projectId, response.created, response.updated,
		                     response.removed);
	} catch (const core::Error& e) {
		response.status  = failed("saveLabels", projectId, e);
		response.changed = false;
	} catch (const std::exception& e) {
		response.status  = failed("saveLabels", projectId, e);
		response.changed = false;
	}
	return response;
}

ClassificationResult ClassificationService::getClassificationResult(std::string_view projectId) {
	ClassificationResult result{};
	try {
		const auto session = open(projectId);
		result.state       = session->state();
		result.segments    = session->segments();
		result.classes     = session->catalog();

		const std::vector<PropagationRecord> history = session->history();
		if (!history.empty()) {
			result.lastRun = history.back();
		}
	} catch (const core::Error& e) {
		result.status = failed("getClassificationResult", projectId, e);
	} catch (const std::exception& e) {
		result.status = failed("getClassificationResult", projectId, e);
	}
	return result;
}

SaveResponse ClassificationService::removeClass(std::string_view projectId, std::string_view className) {
	SaveResponse response{};
	try {
		const auto session = open(projectId);
		const auto writer  = writerOf(projectId);
		std::lock_guard<std::mutex> lock(*writer);

		const std::size_t classes = session->catalog().size();

		response.removed = session->removeClass(className);
		response.changed = session->catalog().size() != classes || response.removed > 0u;
		if (response.changed) {
			persistLabels(projectId, *session);
		}
	} catch (const core::Error& e) {
		response.status = failed("removeClass", projectId, e);
	} catch (const std::exception& e) {
		response.status = failed("removeClass", projectId, e);
	}
	return response;
}

ReviewResponse ClassificationService::review(std::string_view projectId, const double threshold, const std::size_t topK) {
	ReviewResponse response{};
	try {
		const auto session                             = open(projectId);
		const std::vector<core::RankedSegment> ranking = session->ranking();
		const std::vector<core::SegmentId> selected    = core::UncertaintySelector::select(ranking, threshold, topK);

		// select() keeps the ranking order, so the selection is a prefix of it.
		response.segments.assign(ranking.begin(), ranking.begin() + static_cast<std::ptrdiff_t>(selected.size()));
	} catch (const core::Error& e) {
		response.status = failed("review", projectId, e);
	} catch (const std::exception& e) {
		response.status = failed("review", projectId, e);
	}
	return response;
}

ReviewResponse ClassificationService::review(std::string_view projectId) {
	return review(projectId, m_config.selection.threshold, m_config.selection.topK);
}

} // namespace geolabel::classification
