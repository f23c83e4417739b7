#include "time_source.hpp"

#include <stdexcept>

namespace raffle {

Timestamp SystemTimeSource::now() const {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

ManualTimeSource::ManualTimeSource(Timestamp start)
    : now_(start) {}

Timestamp ManualTimeSource::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualTimeSource::advance(std::chrono::seconds delta) {
    if (delta.count() < 0) {
        throw std::invalid_argument("time can only move forward");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualTimeSource::set(Timestamp value) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = value;
}

} // namespace raffle
