#pragma once

#include "types.hpp"

#include <chrono>
#include <mutex>

namespace raffle {

class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual Timestamp now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    Timestamp now() const override;
};

// Clock that only moves when told to; used by the CLI simulation and the tests.
class ManualTimeSource : public TimeSource {
public:
    explicit ManualTimeSource(Timestamp start);

    Timestamp now() const override;
    void advance(std::chrono::seconds delta);
    void set(Timestamp value);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace raffle
