#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wlgen {
    std::shared_ptr<spdlog::logger> const logger = spdlog::stderr_color_st("wlgen");
}
