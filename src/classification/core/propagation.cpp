#include "classification/core/propagation.hpp"

#include "classification/core/errors.hpp"
#include "classification/core/logging.hpp"
#include "classification/core/uncertainty.hpp"

#include "affinityGraph.hpp"
#include "statistics.hpp"

#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <format>
#include <map>
#include <numeric>
#include <set>
#include <utility>

namespace geolabel::classification::core {

namespace {

//! Training set in table row space.
struct TrainingSet {
	std::vector<std::string> classes{};     //!< Sorted class names. Column order of every label matrix.
	std::vector<int> rowClass{};            //!< Per table row: index into classes, -1 if unlabelled.
	std::vector<std::size_t> labeledRows{}; //!< Rows carrying a manual label.
};

//! Unnormalised strategy output.
struct RawOutput {
	cv::Mat distribution{}; //!< rows x classes, CV_64F.
	unsigned iterations{0u};
	bool converged{false};
};

void throwIfCancelled(const std::atomic<bool>* cancel) {
	if (cancel != nullptr && cancel->load()) {
		throw PropagationCancelledError("Propagation was superseded by a newer request.");
	}
}

std::string canonicalMethodName(std::string_view name) {
	std::string out;
	out.reserve(name.size());
	for (const char c: name) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			continue;
		}
		out.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	return out;
}

namespace Validation {

static TrainingSet buildTrainingSet(const FeatureTable& table, const std::vector<LabeledSegment>& labeled) {
	std::set<std::string> distinct;
	for (const LabeledSegment& l: labeled) {
		std::string name = ClassCatalog::normalize(l.className);
		if (name.empty()) {
			throw InvalidClassError("Labelled segment " + std::to_string(l.id) + " has an empty class name.");
		}
		distinct.insert(std::move(name));
	}
	if (distinct.size() < 2u) {
		throw InsufficientLabelsError(std::format("Propagation needs manual labels of at least two distinct classes, found {}.", distinct.size()));
	}

	TrainingSet set{};
	set.classes.assign(distinct.begin(), distinct.end());
	set.rowClass.assign(table.size(), -1);

	for (const LabeledSegment& l: labeled) {
		const std::size_t row = table.rowOf(l.id);
		const auto cls        = std::lower_bound(set.classes.begin(), set.classes.end(), ClassCatalog::normalize(l.className));
		set.rowClass[row]     = static_cast<int>(std::distance(set.classes.begin(), cls));
	}

	for (std::size_t row = 0; row < set.rowClass.size(); ++row) {
		if (set.rowClass[row] >= 0) {
			set.labeledRows.push_back(row);
		}
	}
	return set;
}

static void checkFeatures(const FeatureTable& table) {
	if (table.empty()) {
		throw FeatureDimensionMismatchError("Feature table has no segments.");
	}
	if (table.dimension() == 0u) {
		throw FeatureDimensionMismatchError("Feature table has no feature columns.");
	}
	table.requireFinite();
}

} // namespace Validation

namespace GraphDiffusion {

static cv::Mat initialLabels(const TrainingSet& set) {
	cv::Mat y0 = cv::Mat::zeros(static_cast<int>(set.rowClass.size()), static_cast<int>(set.classes.size()), CV_64F);
	for (const std::size_t row: set.labeledRows) {
		y0.at<double>(static_cast<int>(row), set.rowClass[row]) = 1.0;
	}
	return y0;
}

//! to = T * from. T is D^-1 W (random walk) or D^-1/2 W D^-1/2 (symmetric).
static void diffuse(const AffinityGraph& graph, const cv::Mat& from, cv::Mat& to, const bool symmetric) {
	to.setTo(0.0);
	const int classCount = from.cols;

	for (std::size_t i = 0; i < graph.size(); ++i) {
		const double di = graph.degree[i];
		if (di <= 0.0) {
			continue; // Isolated segment. Row stays zero and is resolved during finalisation.
		}

		double* dst = to.ptr<double>(static_cast<int>(i));
		for (const Edge& e: graph.adjacency[i]) {
			const double dj   = graph.degree[static_cast<std::size_t>(e.target)];
			const double w    = symmetric ? e.weight / std::sqrt(di * dj) : e.weight / di;
			const double* src = from.ptr<double>(e.target);
			for (int c = 0; c < classCount; ++c) {
				dst[c] += w * src[c];
			}
		}
	}
}

static RawOutput clamped(const AffinityGraph& graph, const TrainingSet& set, const PropagationConfig& config, const std::atomic<bool>* cancel,
                         PropagationTrace* trace) {
	const cv::Mat y0 = initialLabels(set);
	cv::Mat current  = y0.clone();
	cv::Mat next(y0.size(), CV_64F);

	RawOutput out{};
	for (int it = 1; it <= config.maxIterations; ++it) {
		throwIfCancelled(cancel);

		diffuse(graph, current, next, false);
		for (const std::size_t row: set.labeledRows) {
			y0.row(static_cast<int>(row)).copyTo(next.row(static_cast<int>(row)));
		}

		const double residual = cv::norm(next, current, cv::NORM_L1);
		std::swap(current, next);
		out.iterations = static_cast<unsigned>(it);
		if (trace) {
			trace->add("residual", residual);
		}
		if (residual < config.tolerance) {
			out.converged = true;
			break;
		}
	}

	out.distribution = current;
	return out;
}

static RawOutput soft(const AffinityGraph& graph, const TrainingSet& set, const PropagationConfig& config, const std::atomic<bool>* cancel,
                      PropagationTrace* trace) {
	const cv::Mat y0   = initialLabels(set);
	const double alpha = std::clamp(config.alpha, 0.0, 1.0);
	cv::Mat current    = y0.clone();
	cv::Mat next(y0.size(), CV_64F);

	RawOutput out{};
	for (int it = 1; it <= config.maxIterations; ++it) {
		throwIfCancelled(cancel);

		diffuse(graph, current, next, true);
		cv::addWeighted(next, alpha, y0, 1.0 - alpha, 0.0, next);

		const double residual = cv::norm(next, current, cv::NORM_L1);
		std::swap(current, next);
		out.iterations = static_cast<unsigned>(it);
		if (trace) {
			trace->add("residual", residual);
		}
		if (residual < config.tolerance) {
			out.converged = true;
			break;
		}
	}

	out.distribution = current;
	return out;
}

} // namespace GraphDiffusion

namespace SelfTrainer {

struct Model {
	cv::Ptr<cv::ml::KNearest> knn;
	int trainCount{0};
};

static Model fit(const cv::Mat& samples32, const std::vector<int>& assigned) {
	cv::Mat train;
	cv::Mat responses;
	for (std::size_t row = 0; row < assigned.size(); ++row) {
		if (assigned[row] < 0) {
			continue;
		}
		train.push_back(samples32.row(static_cast<int>(row)));
		responses.push_back(static_cast<float>(assigned[row]));
	}

	Model model{cv::ml::KNearest::create(), train.rows};
	model.knn->setIsClassifier(true);
	model.knn->setAlgorithmType(cv::ml::KNearest::BRUTE_FORCE);
	if (!model.knn->train(train, cv::ml::ROW_SAMPLE, responses)) {
		throw InsufficientLabelsError("Self-training classifier could not be fitted on " + std::to_string(train.rows) + " labelled segment(s).");
	}
	return model;
}

//! Inverse distance weighted votes of the k nearest training samples. rows = query rows, cols = classes.
static cv::Mat softVotes(const Model& model, const cv::Mat& query, const int k, const int classCount) {
	const int kk = std::clamp(k, 1, model.trainCount);

	cv::Mat results;
	cv::Mat neighborResponses;
	cv::Mat dists;
	model.knn->findNearest(query, kk, results, neighborResponses, dists);

	cv::Mat votes = cv::Mat::zeros(query.rows, classCount, CV_64F);
	for (int r = 0; r < query.rows; ++r) {
		double* dst = votes.ptr<double>(r);
		for (int c = 0; c < kk; ++c) {
			const int cls   = cvRound(neighborResponses.at<float>(r, c));
			const double d2 = std::max(0.0, static_cast<double>(dists.at<float>(r, c)));
			if (cls >= 0 && cls < classCount) {
				dst[cls] += 1.0 / (std::sqrt(d2) + 1e-6);
			}
		}
	}
	return votes;
}

static RawOutput run(const cv::Mat& samples, const TrainingSet& set, const PropagationConfig& config, const std::atomic<bool>* cancel,
                     PropagationTrace* trace) {
	cv::Mat samples32;
	samples.convertTo(samples32, CV_32F);

	const int classCount      = static_cast<int>(set.classes.size());
	std::vector<int> assigned = set.rowClass;

	RawOutput out{};
	for (int round = 1; round <= config.selfTrainingRounds; ++round) {
		throwIfCancelled(cancel);

		std::vector<std::size_t> candidates;
		cv::Mat query;
		for (std::size_t row = 0; row < assigned.size(); ++row) {
			if (assigned[row] < 0) {
				candidates.push_back(row);
				query.push_back(samples32.row(static_cast<int>(row)));
			}
		}
		if (candidates.empty()) {
			out.converged = true;
			break;
		}

		const Model model   = fit(samples32, assigned);
		const cv::Mat votes = softVotes(model, query, config.selfTrainingNeighbors, classCount);

		std::size_t promoted = 0u;
		for (int q = 0; q < votes.rows; ++q) {
			const double* v    = votes.ptr<double>(q);
			const double total = std::accumulate(v, v + classCount, 0.0);
			if (!(total > 0.0)) {
				continue;
			}
			const auto best = std::max_element(v, v + classCount);
			if (*best / total >= config.selfTrainingThreshold) {
				assigned[candidates[static_cast<std::size_t>(q)]] = static_cast<int>(std::distance(v, best));
				++promoted;
			}
		}

		out.iterations = static_cast<unsigned>(round);
		if (trace) {
			trace->add("promoted", static_cast<double>(promoted));
		}
		if (promoted == 0u) {
			out.converged = true;
			break;
		}
	}

	throwIfCancelled(cancel);
	const Model model = fit(samples32, assigned);
	out.distribution  = softVotes(model, samples32, config.selfTrainingNeighbors, classCount);
	return out;
}

} // namespace SelfTrainer

namespace Finalization {

static PropagationResult finalize(const PropagationMethod method, const FeatureTable& table, const TrainingSet& set, const RawOutput& raw,
                                  const double eps) {
	const cv::Mat& dist = raw.distribution;
	if (dist.type() != CV_64F || dist.rows != static_cast<int>(table.size()) || dist.cols != static_cast<int>(set.classes.size())) {
		throw FeatureDimensionMismatchError(std::format("Score matrix is {}x{}, expected {}x{} (segments x classes, CV_64F).", dist.rows, dist.cols,
		                                                table.size(), set.classes.size()));
	}

	// Classes without mass anywhere are treated as absent.
	std::vector<int> kept;
	for (int c = 0; c < dist.cols; ++c) {
		double maxV = 0.0;
		for (int r = 0; r < dist.rows; ++r) {
			const double v = dist.at<double>(r, c);
			if (std::isfinite(v)) {
				maxV = std::max(maxV, v);
			}
		}
		if (maxV >= eps) {
			kept.push_back(c);
		}
	}
	if (kept.empty()) {
		for (int c = 0; c < dist.cols; ++c) {
			kept.push_back(c);
		}
	}

	PropagationResult result{};
	result.method       = method;
	result.labeledCount = set.labeledRows.size();
	result.iterations   = raw.iterations;
	result.converged    = raw.converged;
	for (const int c: kept) {
		result.classes.push_back(set.classes[static_cast<std::size_t>(c)]);
	}

	const std::size_t classCount = kept.size();
	result.predictions.reserve(table.size());
	for (int r = 0; r < dist.rows; ++r) {
		Prediction p{table.ids()[static_cast<std::size_t>(r)], {}, std::vector<double>(classCount, 0.0), 0.0, false};

		bool finite = true;
		double sum  = 0.0;
		for (std::size_t k = 0; k < classCount; ++k) {
			const double v = dist.at<double>(r, kept[k]);
			if (!std::isfinite(v)) {
				finite = false;
				break;
			}
			p.distribution[k] = std::max(0.0, v);
			sum += p.distribution[k];
		}

		if (!finite || sum < eps) {
			std::fill(p.distribution.begin(), p.distribution.end(), 1.0 / static_cast<double>(classCount));
			p.fallback = true;
			++result.fallbackCount;
		} else {
			for (double& v: p.distribution) {
				v /= sum;
			}
		}

		const auto best = std::max_element(p.distribution.begin(), p.distribution.end());
		p.label         = result.classes[static_cast<std::size_t>(std::distance(p.distribution.begin(), best))];
		p.uncertainty   = UncertaintySelector::entropy(p.distribution);
		result.predictions.push_back(std::move(p));
	}

	std::size_t consistent = 0u;
	for (const std::size_t row: set.labeledRows) {
		if (result.predictions[row].label == set.classes[static_cast<std::size_t>(set.rowClass[row])]) {
			++consistent;
		}
	}
	result.trainingConsistency = set.labeledRows.empty() ? 0.0 : static_cast<double>(consistent) / static_cast<double>(set.labeledRows.size());
	return result;
}

} // namespace Finalization

} // namespace

std::string_view toString(const PropagationMethod method) {
	switch (method) {
	case PropagationMethod::GraphClamped:
		return "graph-clamped";
	case PropagationMethod::GraphSoft:
		return "graph-soft";
	case PropagationMethod::SelfTraining:
		return "self-training";
	}
	return "graph-clamped";
}

PropagationMethod parseMethod(std::string_view name) {
	static const std::map<std::string, PropagationMethod, std::less<>> NAMES = {
	        {"graph-clamped", PropagationMethod::GraphClamped},
	        {"label-propagation", PropagationMethod::GraphClamped},
	        {"graph-soft", PropagationMethod::GraphSoft},
	        {"label-spreading", PropagationMethod::GraphSoft},
	        {"self-training", PropagationMethod::SelfTraining},
	};

	const auto it = NAMES.find(canonicalMethodName(name));
	if (it == NAMES.end()) {
		throw UnknownMethodError("Unknown propagation method '" + std::string(name) + "'. Expected graph-clamped, graph-soft or self-training.");
	}
	return it->second;
}

PropagationResult finalizeScores(const PropagationMethod method, const FeatureTable& table, const std::vector<LabeledSegment>& labeled,
                                 const cv::Mat& scores, const double epsilon) {
	const TrainingSet set = Validation::buildTrainingSet(table, labeled);
	return Finalization::finalize(method, table, set, RawOutput{scores, 0u, true}, epsilon);
}

const std::array<PropagationMethod, 3>& propagationMethods() {
	static constexpr std::array<PropagationMethod, 3> METHODS = {
	        PropagationMethod::GraphClamped,
	        PropagationMethod::GraphSoft,
	        PropagationMethod::SelfTraining,
	};
	return METHODS;
}

PropagationEngine::PropagationEngine(PropagationConfig config) : m_config(config) {
}

PropagationResult PropagationEngine::propagate(const PropagationMethod method, const FeatureTable& table, const std::vector<LabeledSegment>& labeled,
                                               const std::atomic<bool>* cancel, PropagationTrace* trace) const {
	const auto start = std::chrono::steady_clock::now();
	throwIfCancelled(cancel);

	const TrainingSet set = Validation::buildTrainingSet(table, labeled);
	Validation::checkFeatures(table);

	logger()->info("Propagating {} labels over {} segments with {} ({} classes).", set.labeledRows.size(), table.size(), toString(method),
	               set.classes.size());

	if (trace) {
		trace->beginStage("standardize");
	}
	const cv::Mat samples = m_config.standardize ? standardize(table.features(), columnStats(table.features())) : table.features().clone();
	if (trace) {
		trace->add("columns", static_cast<double>(samples.cols));
	}

	RawOutput raw{};
	switch (method) {
	case PropagationMethod::GraphClamped:
	case PropagationMethod::GraphSoft: {
		if (trace) {
			trace->beginStage("graph");
		}
		const AffinityGraph graph = buildAffinityGraph(samples, m_config.graph);
		if (trace) {
			trace->add("edges", static_cast<double>(graph.edgeCount()));
			trace->beginStage("diffuse");
		}
		throwIfCancelled(cancel);
		raw = (method == PropagationMethod::GraphClamped) ? GraphDiffusion::clamped(graph, set, m_config, cancel, trace)
		                                                  : GraphDiffusion::soft(graph, set, m_config, cancel, trace);
		break;
	}
	case PropagationMethod::SelfTraining:
		if (trace) {
			trace->beginStage("self-training");
		}
		raw = SelfTrainer::run(samples, set, m_config, cancel, trace);
		break;
	}

	throwIfCancelled(cancel);
	if (trace) {
		trace->beginStage("finalize");
	}
	PropagationResult result = Finalization::finalize(method, table, set, raw, m_config.epsilon);
	if (trace) {
		trace->add("fallback", static_cast<double>(result.fallbackCount));
		trace->add("consistency", result.trainingConsistency);
		trace->endStage();
	}

	if (!result.converged) {
		logger()->warn("{} did not converge within {} iterations.", toString(method), result.iterations);
	}
	if (result.fallbackCount > 0u) {
		logger()->warn("{} segment(s) had a degenerate distribution and fell back to uniform.", result.fallbackCount);
	}

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	logger()->info("{} finished after {} iteration(s) in {} ms. Training consistency {:.3f}.", toString(method), result.iterations, elapsed.count(),
	               result.trainingConsistency);
	return result;
}

} // namespace geolabel::classification::core
