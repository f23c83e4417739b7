#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "randomness.hpp"
#include "types.hpp"
#include "vrf.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace raffle {

struct PendingDraw {
    RequestId requestId = 0;
    RequestParameters params;
    RandomnessConsumer* consumer = nullptr;
    std::uint64_t preSeed = 0;
    bool delivering = false;
};

struct DrawFulfillment {
    RequestId requestId = 0;
    std::optional<VrfProof> proof;
    std::vector<RandomWord> randomWords;
};

// Randomness client backed by libsodium's VRF. Requests are kept until their
// consumer accepts a fulfillment; a failed delivery leaves the request pending so
// it can be retried, and a request being delivered cannot be delivered twice.
//
// Consumers must outlive their pending requests.
class VrfCoordinator : public RandomnessClient {
public:
    VrfCoordinator(Address identity, const VrfKeyPair& keys, DeploymentScope scope);

    const Address& identity() const override { return identity_; }
    RequestId requestDraw(const RequestParameters& params, RandomnessConsumer& consumer) override;

    // Proves the request's alpha and delivers the derived words.
    DrawFulfillment fulfillRandomWords(RequestId requestId);
    // Delivers operator supplied words instead of VRF output (local networks).
    DrawFulfillment fulfillRandomWordsWithOverride(RequestId requestId,
                                                   std::vector<RandomWord> randomWords);

    bool isPending(RequestId requestId) const;
    std::size_t pendingCount() const;
    std::optional<PendingDraw> pendingDraw(RequestId requestId) const;
    const std::string& publicKey() const { return prover_.publicKey(); }
    const DeploymentScope& scope() const { return scope_; }

private:
    PendingDraw claim(RequestId requestId);
    void deliver(const PendingDraw& draw, const std::vector<RandomWord>& randomWords);

    Address identity_;
    VrfProver prover_;
    DeploymentScope scope_;

    mutable std::mutex mutex_;
    std::map<RequestId, PendingDraw> pending_;
    RequestId nextRequestId_;
    std::uint64_t nonce_;
    Logger log_;
};

} // namespace raffle
