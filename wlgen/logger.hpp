#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace wlgen {
    extern std::shared_ptr<spdlog::logger> const logger;
}
