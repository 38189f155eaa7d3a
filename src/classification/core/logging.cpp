#include "classification/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <vector>

namespace geolabel::classification::core {

namespace {

constexpr const char* LOGGER_NAME = "geolabel";

std::mutex& loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

std::shared_ptr<spdlog::logger> createLogger(const LoggingConfig& config) {
	std::vector<spdlog::sink_ptr> sinks;
	sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
	if (!config.file.empty()) {
		sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
	}

	auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
	log->set_level(spdlog::level::from_str(config.level));
	log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
	log->flush_on(spdlog::level::warn);
	return log;
}

} // namespace

void initLogging(const LoggingConfig& config) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	spdlog::drop(LOGGER_NAME);
	spdlog::register_logger(createLogger(config));
}

std::shared_ptr<spdlog::logger> logger() {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (auto log = spdlog::get(LOGGER_NAME)) {
		return log;
	}
	auto log = createLogger(LoggingConfig{});
	spdlog::register_logger(log);
	return log;
}

} // namespace geolabel::classification::core
