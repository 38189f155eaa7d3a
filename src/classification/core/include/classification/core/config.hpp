#pragma once

#include <cstddef>
#include <string>

namespace geolabel::classification::core {

//! How segment affinities are computed from standardized features.
enum class GraphKernel { Knn, Rbf };

//! Affinity graph parameters.
struct GraphConfig {
	GraphKernel kernel{GraphKernel::Knn};
	int neighbors{7};    //!< Neighbours per segment for the kNN kernel (graph is symmetrised afterwards).
	double gamma{20.0};  //!< RBF kernel width. Dense kernel, intended for small tables.
};

//! Parameters shared by all propagation strategies.
struct PropagationConfig {
	GraphConfig graph{};
	bool standardize{true};       //!< Zero mean / unit variance per feature column before building the graph.
	int maxIterations{1000};      //!< Diffusion iteration budget.
	double tolerance{1e-3};       //!< Stop when the summed absolute change of the label matrix drops below this.
	double alpha{0.2};            //!< Soft strategy: weight of the diffused term vs. the initial labels.
	int selfTrainingNeighbors{7}; //!< Self-training: k of the nearest neighbour classifier.
	double selfTrainingThreshold{0.75}; //!< Self-training: minimum class probability to promote a pseudo label.
	int selfTrainingRounds{10};   //!< Self-training: maximum number of promotion rounds.
	double epsilon{1e-12};        //!< Probability mass treated as zero.
};

//! Active learning selection defaults.
struct SelectionConfig {
	double threshold{0.6};
	std::size_t topK{50u};
};

//! Logger setup.
struct LoggingConfig {
	std::string level{"info"}; //!< spdlog level name (trace, debug, info, warn, err, critical, off).
	std::string file{};        //!< Optional log file. Empty -> console only.
};

//! Everything a service instance needs.
struct EngineConfig {
	PropagationConfig propagation{};
	SelectionConfig selection{};
	LoggingConfig logging{};
	std::string projectRoot{"projects"}; //!< Directory holding one sub directory per project.
};

/*! Read configuration overrides from an OpenCV FileStorage file (YAML or JSON).
 *  Keys missing in the file keep their defaults.
 * \param [in] path Config file path.
 * \return     Merged configuration.
 * \throws     PersistenceError if the file cannot be opened or parsed.
 */
EngineConfig loadConfig(const std::string& path);

} // namespace geolabel::classification::core
