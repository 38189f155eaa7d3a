#include "classification/core/propagationTrace.hpp"

#include "classification/core/logging.hpp"

#include <format>

namespace geolabel::classification::core {

void PropagationTrace::beginStage(std::string name) {
	m_stages.push_back(TraceStage{std::move(name)});
	m_open = true;
}

void PropagationTrace::endStage() {
	m_open = false;
}

void PropagationTrace::add(std::string name, double value) {
	if (!m_open) {
		beginStage("unnamed");
	}

	TraceStage& stage = m_stages.back();
	if (m_verbose) {
		logger()->debug("[trace] {} / {} = {}", stage.name, name, value);
	}
	stage.steps.push_back(TraceStep{std::move(name), value});
}

void PropagationTrace::clear() {
	m_stages.clear();
	m_open = false;
}

std::string PropagationTrace::summary() const {
	std::string out;
	for (const TraceStage& stage: m_stages) {
		out += std::format("{} ({})", stage.name, stage.steps.size());
		if (!stage.steps.empty()) {
			out += std::format(": {} = {:.6g}", stage.steps.back().name, stage.steps.back().value);
		}
		out += '\n';
	}
	return out;
}

} // namespace geolabel::classification::core
