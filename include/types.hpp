#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace raffle {

using Address = std::string;
// Smallest currency unit (wei).
using Amount = std::uint64_t;
using RequestId = std::uint64_t;
using RandomWord = boost::multiprecision::uint256_t;

// Block-style timestamps: whole seconds on the system clock.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

enum class RoundState { OPEN, CALCULATING };

std::string toString(RoundState state);

} // namespace raffle
