#pragma once

#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace raffle {

constexpr std::uint32_t kMaxNumWords = 500;
constexpr std::uint16_t kMaxRequestConfirmations = 200;

// Parameters forwarded verbatim to the randomness client on every draw.
struct RequestParameters {
    std::string keyHash = "474e34a077df58807dbe9c96d3c009b23b3c6d0cce433e59bbf5b34f823bc56c";
    std::uint64_t subscriptionId = 0;
    std::uint16_t requestConfirmations = 3;
    std::uint32_t callbackGasLimit = 500'000;
    std::uint32_t numWords = 1;
};

enum class PayoutPolicy { FULL_POOL_TO_WINNER };

struct RaffleConfig {
    Amount entranceFee = 10'000'000'000'000'000; // 0.01 ether
    std::chrono::seconds interval{ 30 };
    RequestParameters request;
    PayoutPolicy payoutPolicy = PayoutPolicy::FULL_POOL_TO_WINNER;
    Address randomnessClient = "vrf-coordinator";
    Address custodyAccount = "raffle";
};

void validateRequestParameters(const RequestParameters& params);
void validateConfig(const RaffleConfig& cfg);

RaffleConfig loadConfigFromEnv(RaffleConfig defaults = {});

struct DeploymentScope {
    std::string deploymentId;
    std::string chainId;
};

// RAFFLE_DEPLOYMENT_ID is mandatory and may not be "default"; RAFFLE_CHAIN_ID is optional.
DeploymentScope resolveDeploymentScope(const std::string& fallbackDeploymentId = {});

} // namespace raffle
