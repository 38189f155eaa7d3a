#pragma once

#include <string>
#include <vector>

namespace geolabel::classification::core {

//! A single measurement recorded during a stage (e.g. residual of one iteration).
struct TraceStep {
	std::string name; //!< Some name.
	double value;     //!< Measured value.
};

//! Propagation runs in stages (standardize, graph, diffuse, finalize). We collect measurements per stage.
struct TraceStage {
	std::string name;               //!< Name of the stage.
	std::vector<TraceStep> steps{}; //!< Measurements in insertion order.
};

//! Can be passed to PropagationEngine::propagate to collect intermediate values for diagnostics.
//! The last stage stays open until endStage() or the next beginStage(). Measurements added outside a stage go to an "unnamed" one.
class PropagationTrace {
public:
	void beginStage(std::string name);
	void add(std::string name, double value); //!< Logged at debug level in verbose mode.
	void endStage();

	const std::vector<TraceStage>& stages() const {
		return m_stages;
	}
	std::string summary() const; //!< One line per stage with step count and last value.

	void setVerbose(const bool verbose) {
		m_verbose = verbose;
	}
	void clear();

private:
	bool m_verbose{false};
	bool m_open{false}; //!< add() appends to m_stages.back().
	std::vector<TraceStage> m_stages{};
};

} // namespace geolabel::classification::core
