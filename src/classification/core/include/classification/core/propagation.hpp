#pragma once

#include "classification/core/config.hpp"
#include "classification/core/featureTable.hpp"
#include "classification/core/labelStore.hpp"
#include "classification/core/propagationTrace.hpp"

#include <opencv2/core/mat.hpp>

#include <array>
#include <atomic>
#include <string>
#include <string_view>
#include <vector>

// Label propagation turns a handful of manually labelled segments into a class distribution for every segment.
// All strategies share the same pipeline:
//   1) Validate      -> finite features, at least two labelled classes, known segment ids.
//   2) Standardize   -> zero mean / unit variance per feature column.
//   3) Diffuse       -> strategy specific (graph diffusion with hard or soft clamping, or self-training).
//   4) Finalize      -> drop classes without mass, renormalise rows (uniform fallback for degenerate rows), argmax, entropy.
namespace geolabel::classification::core {

//! Closed set of propagation strategies.
enum class PropagationMethod {
	GraphClamped, //!< Graph diffusion, known labels reset after every iteration.
	GraphSoft,    //!< Graph diffusion over the normalised graph, known labels re-estimated (alpha).
	SelfTraining, //!< kNN classifier retrained on its own confident predictions.
};

std::string_view toString(PropagationMethod method);

//! Parse "graph-clamped", "graph-soft", "self-training" (plus "label_propagation" / "label_spreading"). Case and '_'/'-' insensitive.
//! \throws UnknownMethodError
PropagationMethod parseMethod(std::string_view name);

const std::array<PropagationMethod, 3>& propagationMethods();

//! Prediction for one segment.
struct Prediction {
	SegmentId id;
	std::string label;                 //!< Most probable class.
	std::vector<double> distribution;  //!< Aligned to PropagationResult::classes. Sums to 1.
	double uncertainty{0.0};           //!< Normalised entropy of distribution.
	bool fallback{false};              //!< Degenerate output replaced by the uniform distribution.
};

struct PropagationResult {
	PropagationMethod method{PropagationMethod::GraphClamped};
	std::vector<std::string> classes{};     //!< Sorted class names present in the output.
	std::vector<Prediction> predictions{};  //!< One per segment, feature table order.
	double trainingConsistency{0.0};        //!< Fraction of labelled segments predicted as their manual label.
	std::size_t labeledCount{0u};
	unsigned iterations{0u};                //!< Diffusion iterations or self-training rounds.
	bool converged{false};
	std::size_t fallbackCount{0u};          //!< Rows replaced by the uniform distribution.
};

/*! Last pipeline step on a raw score matrix (rows in table order, columns the sorted distinct classes of labeled).
 *  Classes below epsilon in every row are dropped, so entropies are normalised by the remaining class count.
 *  Rows without mass or with non-finite scores fall back to the uniform distribution.
 * \throws InsufficientLabelsError, UnknownSegmentError, FeatureDimensionMismatchError (score matrix shape or type).
 */
PropagationResult finalizeScores(PropagationMethod method, const FeatureTable& table, const std::vector<LabeledSegment>& labeled,
                                 const cv::Mat& scores, double epsilon);

/*! Runs a propagation strategy over a feature table.
 *  Stateless apart from its configuration. Safe to call concurrently.
 */
class PropagationEngine {
public:
	explicit PropagationEngine(PropagationConfig config = PropagationConfig{});

	/*! Propagate manual labels to every segment.
	 * \param [in]     method  Strategy.
	 * \param [in]     table   Feature table.
	 * \param [in]     labeled Manually labelled subset (training set).
	 * \param [in]     cancel  Optional flag polled between iterations.
	 * \param [in,out] trace   Optional diagnostics collector.
	 * \return         Predictions for all segments, including the labelled ones.
	 * \throws         InsufficientLabelsError        Fewer than two distinct classes in labeled.
	 * \throws         FeatureDimensionMismatchError  Non-finite feature values (message names the segment).
	 * \throws         UnknownSegmentError            Labelled id not in the table.
	 * \throws         PropagationCancelledError      cancel was raised. No partial result is produced.
	 */
	PropagationResult propagate(PropagationMethod method, const FeatureTable& table, const std::vector<LabeledSegment>& labeled,
	                            const std::atomic<bool>* cancel = nullptr, PropagationTrace* trace = nullptr) const;

private:
	PropagationConfig m_config;
};

} // namespace geolabel::classification::core
