#include "steward/logging.hpp"
#include "steward/platform.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace steward {

bool init_logging(Config& config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (create_directories(config.paths.logs_dir)) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.paths.logs_dir + "/steward.log",
                config.log_max_bytes, config.log_max_files);
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        }
    } catch (const spdlog::spdlog_ex&) {
        sinks.clear();
    }

    if (verbose) {
        auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        err_sink->set_level(spdlog::level::debug);
        sinks.push_back(err_sink);
    }

    if (sinks.empty()) {
        return false;
    }

    auto logger = std::make_shared<spdlog::logger>("steward", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%n] %l: %v");
    logger->flush_on(spdlog::level::info);
    config.logger = logger;
    return true;
}

std::shared_ptr<spdlog::logger> component_logger(const Config& config, const std::string& component) {
    if (config.logger) {
        return config.logger->clone(component);
    }
    return std::make_shared<spdlog::logger>(component, std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace steward
