#include "classification/core/labelStore.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/propagation.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>

namespace geolabel::classification::core {

std::string_view toString(const LabelOrigin origin) {
	switch (origin) {
	case LabelOrigin::None:
		return "none";
	case LabelOrigin::Manual:
		return "manual";
	case LabelOrigin::Predicted:
		return "predicted";
	}
	return "none";
}

std::string utcNow() {
	const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
	return std::format("{:%FT%TZ}", now);
}

LabelStore::LabelStore(std::shared_ptr<const FeatureTable> table) : m_table(std::move(table)) {
	if (!m_table) {
		m_table = std::make_shared<const FeatureTable>();
	}
	m_records.resize(m_table->size());
}

std::string LabelStore::setManual(const SegmentId id, std::string_view className, std::string_view color, std::string_view analyst,
                                  std::string_view timestamp) {
	const std::size_t row = m_table->rowOf(id);
	const std::string name = ClassCatalog::normalize(className);
	std::string stored     = m_catalog.registerClass(name, color);

	LabelRecord& rec = m_records[row];
	if (rec.manual && rec.manual->className == name) {
		rec.manual->color = stored;
		if (!analyst.empty()) {
			rec.manual->analyst = std::string(analyst);
		}
		return stored;
	}

	rec.manual = ManualLabel{name, stored, std::string(analyst), timestamp.empty() ? utcNow() : std::string(timestamp)};
	return stored;
}

bool LabelStore::clearManual(const SegmentId id) {
	LabelRecord& rec = m_records[m_table->rowOf(id)];
	if (!rec.manual) {
		return false;
	}
	rec.manual.reset();
	return true;
}

std::size_t LabelStore::removeClass(std::string_view name) {
	const std::string key = ClassCatalog::normalize(name);
	m_catalog.remove(key);

	std::size_t cleared = 0u;
	for (LabelRecord& rec: m_records) {
		if (rec.manual && rec.manual->className == key) {
			rec.manual.reset();
			++cleared;
		}
	}
	return cleared;
}

void LabelStore::applyPropagationResult(const PropagationResult& result) {
	for (const Prediction& p: result.predictions) {
		PredictedLabel predicted{p.label, {}, p.uncertainty};
		for (std::size_t c = 0; c < result.classes.size() && c < p.distribution.size(); ++c) {
			predicted.probabilities.emplace(result.classes[c], p.distribution[c]);
		}
		m_records[m_table->rowOf(p.id)].predicted = std::move(predicted);
	}
}

void LabelStore::restorePrediction(const SegmentId id, PredictedLabel predicted) {
	m_records[m_table->rowOf(id)].predicted = std::move(predicted);
}

std::vector<LabeledSegment> LabelStore::exportLabeled() const {
	std::vector<LabeledSegment> out;
	for (std::size_t row = 0; row < m_records.size(); ++row) {
		if (const auto& manual = m_records[row].manual) {
			out.push_back({m_table->ids()[row], manual->className, manual->color});
		}
	}
	std::sort(out.begin(), out.end(), [](const LabeledSegment& a, const LabeledSegment& b) { return a.id < b.id; });
	return out;
}

const LabelRecord& LabelStore::record(const SegmentId id) const {
	return m_records[m_table->rowOf(id)];
}

LabelOrigin LabelStore::origin(const SegmentId id) const {
	const LabelRecord& rec = record(id);
	if (rec.manual) {
		return LabelOrigin::Manual;
	}
	if (rec.predicted) {
		return LabelOrigin::Predicted;
	}
	return LabelOrigin::None;
}

std::optional<std::string> LabelStore::displayLabel(const SegmentId id) const {
	const LabelRecord& rec = record(id);
	if (rec.manual) {
		return rec.manual->className;
	}
	if (rec.predicted) {
		return rec.predicted->className;
	}
	return std::nullopt;
}

std::string LabelStore::displayColor(const SegmentId id) const {
	const auto label = displayLabel(id);
	if (!label) {
		return std::string(ClassCatalog::UNCLASSIFIED_COLOR);
	}
	return m_catalog.colorOf(*label);
}

std::set<std::string> LabelStore::distinctManualClasses() const {
	std::set<std::string> classes;
	for (const LabelRecord& rec: m_records) {
		if (rec.manual) {
			classes.insert(rec.manual->className);
		}
	}
	return classes;
}

std::size_t LabelStore::manualCount() const {
	return static_cast<std::size_t>(std::count_if(m_records.begin(), m_records.end(), [](const LabelRecord& rec) { return rec.manual.has_value(); }));
}

bool LabelStore::hasPredictions() const {
	return std::any_of(m_records.begin(), m_records.end(), [](const LabelRecord& rec) { return rec.predicted.has_value(); });
}

} // namespace geolabel::classification::core
