#include "classification/core/config.hpp"
#include "classification/core/errors.hpp"
#include "classification/core/featureTable.hpp"
#include "classification/core/labelStore.hpp"
#include "classification/core/logging.hpp"
#include "classification/service.hpp"

#include <boost/program_options.hpp>

#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace geolabel::classification {

// Commands:
//   import       --features <file>                            Create a project from a feature table.
//   propagate    --method <name>                              Run label propagation and store the predictions.
//   label        --segment <id> --class <name> [--color] [--analyst]
//   unlabel      --segment <id>
//   remove-class --class <name>
//   review       [--threshold] [--top-k]                      Most uncertain unlabelled segments.
//   result                                                    Per segment labels, colour and uncertainty.

static int printStatus(const Status& status) {
	if (status.ok) {
		return EXIT_SUCCESS;
	}
	std::cerr << "[Error] " << status.errorKind << ": " << status.message << "\n";
	return EXIT_FAILURE;
}

//! Current manual overlay of a project as save requests.
static std::vector<ManualLabelRequest> currentOverlay(const ClassificationResult& result) {
	std::vector<ManualLabelRequest> overlay;
	for (const SegmentView& view: result.segments) {
		if (view.manualLabel) {
			overlay.push_back({view.id, *view.manualLabel});
		}
	}
	return overlay;
}

static int runImport(ClassificationService& service, const std::string& projectId, const po::variables_map& vm) {
	if (!vm.count("features")) {
		std::cerr << "[Error] import needs --features <file>.\n";
		return EXIT_FAILURE;
	}

	try {
		const core::FeatureTable table = core::FeatureTable::load(vm["features"].as<std::string>());
		service.store().createProject(projectId, table);
	} catch (const core::Error& e) {
		return printStatus({false, std::string(core::toString(e.kind())), e.what()});
	}
	std::cout << "Imported project '" << projectId << "' into " << service.store().root().string() << ".\n";
	return EXIT_SUCCESS;
}

static int runPropagate(ClassificationService& service, const std::string& projectId, const po::variables_map& vm) {
	const PropagateResponse response = service.propagate(projectId, vm["method"].as<std::string>());
	if (!response.status.ok) {
		return printStatus(response.status);
	}

	std::cout << "method:               " << response.method << "\n";
	std::cout << "training consistency: " << std::fixed << std::setprecision(3) << response.trainingConsistency << "\n";
	std::cout << "labelled / total:     " << response.labeledSegments << " / " << response.totalSegments << "\n";
	std::cout << "classes:             ";
	for (const std::string& name: response.classes) {
		std::cout << " " << name;
	}
	std::cout << "\n";
	for (const SegmentPrediction& p: response.predictions) {
		std::cout << std::setw(8) << p.id << "  " << std::setw(16) << std::left << p.label << std::right << "  " << p.uncertainty << "\n";
	}
	return EXIT_SUCCESS;
}

static int runLabel(ClassificationService& service, const std::string& projectId, const po::variables_map& vm) {
	if (!vm.count("segment") || !vm.count("class")) {
		std::cerr << "[Error] label needs --segment <id> and --class <name>.\n";
		return EXIT_FAILURE;
	}

	const ClassificationResult current = service.getClassificationResult(projectId);
	if (!current.status.ok) {
		return printStatus(current.status);
	}

	std::vector<ManualLabelRequest> overlay = currentOverlay(current);
	ManualLabelRequest req{vm["segment"].as<int>(), vm["class"].as<std::string>()};
	if (vm.count("color")) {
		req.color = vm["color"].as<std::string>();
	}
	if (vm.count("analyst")) {
		req.analyst = vm["analyst"].as<std::string>();
	}
	overlay.push_back(std::move(req));

	const SaveResponse response = service.saveLabels(projectId, overlay);
	if (!response.status.ok) {
		return printStatus(response.status);
	}
	std::cout << (response.changed ? "Saved" : "Unchanged") << " (" << response.created << " created, " << response.updated << " updated).\n";
	return EXIT_SUCCESS;
}

static int runUnlabel(ClassificationService& service, const std::string& projectId, const po::variables_map& vm) {
	if (!vm.count("segment")) {
		std::cerr << "[Error] unlabel needs --segment <id>.\n";
		return EXIT_FAILURE;
	}

	const ClassificationResult current = service.getClassificationResult(projectId);
	if (!current.status.ok) {
		return printStatus(current.status);
	}

	const int segment = vm["segment"].as<int>();
	std::vector<ManualLabelRequest> overlay;
	for (ManualLabelRequest& req: currentOverlay(current)) {
		if (req.id != segment) {
			overlay.push_back(std::move(req));
		}
	}

	const SaveResponse response = service.saveLabels(projectId, overlay);
	if (!response.status.ok) {
		return printStatus(response.status);
	}
	std::cout << (response.changed ? "Removed label." : "Segment had no manual label.") << "\n";
	return EXIT_SUCCESS;
}

static int runRemoveClass(ClassificationService& service, const std::string& projectId, const po::variables_map& vm) {
	if (!vm.count("class")) {
		std::cerr << "[Error] remove-class needs --class <name>.\n";
		return EXIT_FAILURE;
	}

	const SaveResponse response = service.removeClass(projectId, vm["class"].as<std::string>());
	if (!response.status.ok) {
		return printStatus(response.status);
	}
	std::cout << "Removed class, cleared " << response.removed << " manual labels.\n";
	return EXIT_SUCCESS;
}

static int runReview(ClassificationService& service, const std::string& projectId, double threshold, std::size_t topK) {
	const ReviewResponse response = service.review(projectId, threshold, topK);
	if (!response.status.ok) {
		return printStatus(response.status);
	}

	for (const core::RankedSegment& r: response.segments) {
		std::cout << std::setw(8) << r.id << "  " << std::fixed << std::setprecision(3) << r.entropy << "\n";
	}
	return EXIT_SUCCESS;
}

static int runResult(ClassificationService& service, const std::string& projectId) {
	const ClassificationResult result = service.getClassificationResult(projectId);
	if (!result.status.ok) {
		return printStatus(result.status);
	}

	std::cout << "state: " << toString(result.state) << "\n";
	for (const core::ClassEntry& entry: result.classes) {
		std::cout << "class " << entry.name << " " << entry.color << "\n";
	}
	for (const SegmentView& view: result.segments) {
		std::cout << std::setw(8) << view.id << "  " << std::setw(10) << std::left << core::toString(view.origin) << std::setw(16)
		          << view.displayLabel.value_or("-") << std::right << view.color;
		if (view.uncertainty) {
			std::cout << "  " << std::fixed << std::setprecision(3) << *view.uncertainty;
		}
		std::cout << "\n";
	}
	return EXIT_SUCCESS;
}

} // namespace geolabel::classification

int main(int argc, char** argv) {
	using namespace geolabel::classification;

	po::options_description desc("Allowed options");
	// clang-format off
	desc.add_options()
		("help,h", "produce help message")
		("command", po::value<std::string>(), "import | propagate | label | unlabel | remove-class | review | result")
		("project,p", po::value<std::string>(), "project id")
		("project-root", po::value<std::string>(), "directory holding the projects (overrides the config)")
		("config,c", po::value<std::string>(), "configuration file (OpenCV FileStorage YAML/JSON)")
		("features", po::value<std::string>(), "feature table to import")
		("method,m", po::value<std::string>()->default_value("graph-clamped"), "graph-clamped | graph-soft | self-training")
		("segment,s", po::value<int>(), "segment id")
		("class", po::value<std::string>(), "class name")
		("color", po::value<std::string>(), "class colour #rrggbb (new classes only)")
		("analyst", po::value<std::string>(), "analyst name stored with the label")
		("threshold", po::value<double>(), "review: minimum uncertainty")
		("top-k", po::value<std::size_t>(), "review: maximum number of segments")
		("verbose,v", "debug logging");
	// clang-format on

	po::positional_options_description positional;
	positional.add("command", 1);

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
		if (vm.count("help") || !vm.count("command")) {
			std::cout << "usage: " << argv[0] << " <command> --project <id> [options]\n" << desc << "\n";
			return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
		}
		po::notify(vm);
	} catch (const po::error& e) {
		std::cerr << "[Error] " << e.what() << "\n\n";
		std::cerr << "usage: " << argv[0] << " <command> --project <id> [options]\n" << desc << "\n";
		return EXIT_FAILURE;
	}

	core::EngineConfig config{};
	try {
		if (vm.count("config")) {
			config = core::loadConfig(vm["config"].as<std::string>());
		}
	} catch (const core::Error& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return EXIT_FAILURE;
	}
	if (vm.count("project-root")) {
		config.projectRoot = vm["project-root"].as<std::string>();
	}
	if (vm.count("verbose")) {
		config.logging.level = "debug";
	}
	core::initLogging(config.logging);

	if (!vm.count("project")) {
		std::cerr << "[Error] No project specified (--project).\n";
		return EXIT_FAILURE;
	}

	const std::string command   = vm["command"].as<std::string>();
	const std::string projectId = vm["project"].as<std::string>();
	const double threshold      = vm.count("threshold") ? vm["threshold"].as<double>() : config.selection.threshold;
	const std::size_t topK      = vm.count("top-k") ? vm["top-k"].as<std::size_t>() : config.selection.topK;

	ClassificationService service(config);

	if (command == "import") {
		return runImport(service, projectId, vm);
	}
	if (command == "propagate") {
		return runPropagate(service, projectId, vm);
	}
	if (command == "label") {
		return runLabel(service, projectId, vm);
	}
	if (command == "unlabel") {
		return runUnlabel(service, projectId, vm);
	}
	if (command == "remove-class") {
		return runRemoveClass(service, projectId, vm);
	}
	if (command == "review") {
		return runReview(service, projectId, threshold, topK);
	}
	if (command == "result") {
		return runResult(service, projectId);
	}

	std::cerr << "[Error] Unknown command '" << command << "'.\n";
	return EXIT_FAILURE;
}
