#pragma once

#include "steward/config.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace steward {

// Attach a rotating file sink under paths.logs_dir to config.logger, plus a
// stderr sink at debug level when verbose. Returns false (and leaves
// config.logger unset) when no sink could be attached.
bool init_logging(Config& config, bool verbose);

// Named child of config.logger sharing its sinks, or a null-sink logger
std::shared_ptr<spdlog::logger> component_logger(const Config& config, const std::string& component);

} // namespace steward
