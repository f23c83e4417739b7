#include "logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace raffle {

Logger createLogger(const std::string& tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    Logger logger = spdlog::get(tag);
    if (logger == nullptr) {
        logger = spdlog::stdout_color_mt(tag);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
    }
    return logger;
}

} // namespace raffle
