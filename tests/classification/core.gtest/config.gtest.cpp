#include "classification/core/config.hpp"
#include "classification/core/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace geolabel::classification::core {
namespace gtest {

static std::filesystem::path writeConfig(const std::string& name, const std::string& content) {
	const auto dir = std::filesystem::temp_directory_path() / "geolabel_config_gtest";
	std::filesystem::create_directories(dir);
	const auto path = dir / name;
	std::ofstream(path) << content;
	return path;
}

TEST(ConfigUnit, Defaults) {
	const EngineConfig config{};
	EXPECT_EQ(config.propagation.graph.kernel, GraphKernel::Knn);
	EXPECT_EQ(config.propagation.graph.neighbors, 7);
	EXPECT_DOUBLE_EQ(config.propagation.alpha, 0.2);
	EXPECT_DOUBLE_EQ(config.propagation.epsilon, 1e-12);
	EXPECT_DOUBLE_EQ(config.selection.threshold, 0.6);
	EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigUnit, Load_PartialOverride) {
	const auto path = writeConfig("partial.yml", "%YAML:1.0\n"
	                                             "---\n"
	                                             "propagation:\n"
	                                             "   graph:\n"
	                                             "      kernel: rbf\n"
	                                             "      gamma: 5.\n"
	                                             "   alpha: 0.5\n"
	                                             "selection:\n"
	                                             "   topK: 12\n"
	                                             "projectRoot: \"/data/projects\"\n");

	const EngineConfig config = loadConfig(path.string());
	EXPECT_EQ(config.propagation.graph.kernel, GraphKernel::Rbf);
	EXPECT_DOUBLE_EQ(config.propagation.graph.gamma, 5.0);
	EXPECT_EQ(config.propagation.graph.neighbors, 7);
	EXPECT_DOUBLE_EQ(config.propagation.alpha, 0.5);
	EXPECT_EQ(config.propagation.maxIterations, 1000);
	EXPECT_EQ(config.selection.topK, 12u);
	EXPECT_DOUBLE_EQ(config.selection.threshold, 0.6);
	EXPECT_EQ(config.projectRoot, "/data/projects");
}

TEST(ConfigUnit, Load_UnknownKernel) {
	const auto path = writeConfig("kernel.yml", "%YAML:1.0\n"
	                                            "---\n"
	                                            "propagation:\n"
	                                            "   graph:\n"
	                                            "      kernel: svm\n");
	EXPECT_THROW(loadConfig(path.string()), PersistenceError);
}

TEST(ConfigUnit, Load_Missing) {
	EXPECT_THROW(loadConfig("/nonexistent/geolabel.yml"), PersistenceError);
}

} // namespace gtest
} // namespace geolabel::classification::core
