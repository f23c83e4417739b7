#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace raffle {

using Logger = std::shared_ptr<spdlog::logger>;

// Returns the process-wide logger registered under `tag`, creating it on first use.
Logger createLogger(const std::string& tag);

} // namespace raffle
