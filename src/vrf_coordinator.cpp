#include "vrf_coordinator.hpp"

#include "errors.hpp"

#include "picosha2.h"

#include <array>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace raffle {

namespace {

std::uint64_t derivePreSeed(const RequestParameters& params, std::uint64_t nonce) {
    std::ostringstream oss;
    oss << "preseed|" << params.keyHash << "|" << params.subscriptionId << "|" << nonce;
    const std::string input = oss.str();

    std::array<unsigned char, 32> digest{};
    picosha2::hash256(input.begin(), input.end(), digest.begin(), digest.end());

    std::uint64_t seed = 0;
    for (int i = 0; i < 8; ++i) {
        seed = (seed << 8) | digest[i];
    }
    return seed;
}

} // namespace

VrfCoordinator::VrfCoordinator(Address identity, const VrfKeyPair& keys, DeploymentScope scope)
    : identity_(std::move(identity))
    , prover_(keys.secretKeyHex, keys.publicKeyHex)
    , scope_(std::move(scope))
    , nextRequestId_(1)
    , nonce_(0)
    , log_(createLogger("vrf")) {
    if (identity_.empty()) {
        throw std::invalid_argument("coordinator identity must not be empty");
    }
    if (scope_.deploymentId.empty()) {
        throw std::invalid_argument("coordinator requires a deploymentId");
    }
}

RequestId VrfCoordinator::requestDraw(const RequestParameters& params, RandomnessConsumer& consumer) {
    validateRequestParameters(params);
    if (consumer.randomnessClient() != identity_) {
        throw std::invalid_argument("consumer expects fulfillments from " +
                                    consumer.randomnessClient() + ", not " + identity_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    PendingDraw draw;
    draw.requestId = nextRequestId_++;
    draw.params = params;
    draw.consumer = &consumer;
    draw.preSeed = derivePreSeed(params, ++nonce_);
    pending_.emplace(draw.requestId, draw);

    log_->info("RandomWordsRequested: requestId={} subId={} confirmations={} gasLimit={} words={}",
               draw.requestId,
               params.subscriptionId,
               params.requestConfirmations,
               params.callbackGasLimit,
               params.numWords);
    return draw.requestId;
}

DrawFulfillment VrfCoordinator::fulfillRandomWords(RequestId requestId) {
    PendingDraw draw = claim(requestId);

    DrawFulfillment result;
    result.requestId = requestId;
    try {
        const std::string alpha = buildRequestAlpha(scope_.deploymentId,
                                                    scope_.chainId,
                                                    draw.params.keyHash,
                                                    draw.params.subscriptionId,
                                                    requestId,
                                                    draw.preSeed);
        result.proof = prover_.prove(alpha);
        result.randomWords = expandRandomWords(result.proof->outputHex, draw.params.numWords);
    } catch (const std::exception& ex) {
        log_->error("could not prove request {}: {}", requestId, ex.what());
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[requestId].delivering = false;
        throw;
    }

    deliver(draw, result.randomWords);
    return result;
}

DrawFulfillment VrfCoordinator::fulfillRandomWordsWithOverride(RequestId requestId,
                                                               std::vector<RandomWord> randomWords) {
    PendingDraw draw = claim(requestId);
    if (randomWords.size() != draw.params.numWords) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[requestId].delivering = false;
        throw std::invalid_argument("InvalidRandomWords: expected " +
                                    std::to_string(draw.params.numWords) + " words, got " +
                                    std::to_string(randomWords.size()));
    }

    DrawFulfillment result;
    result.requestId = requestId;
    result.randomWords = std::move(randomWords);
    deliver(draw, result.randomWords);
    return result;
}

PendingDraw VrfCoordinator::claim(RequestId requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(requestId);
    if (it == pending_.end() || it->second.delivering) {
        log_->warn("rejecting fulfillment for unknown or in-flight request {}", requestId);
        throw UnknownRequestError(requestId);
    }
    it->second.delivering = true;
    return it->second;
}

void VrfCoordinator::deliver(const PendingDraw& draw, const std::vector<RandomWord>& randomWords) {
    try {
        draw.consumer->rawFulfillRandomWords(identity_, draw.requestId, randomWords);
    } catch (const std::exception& ex) {
        log_->warn("consumer rejected request {}: {}; request stays pending", draw.requestId, ex.what());
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[draw.requestId].delivering = false;
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(draw.requestId);
    log_->info("RandomWordsFulfilled: requestId={}", draw.requestId);
}

bool VrfCoordinator::isPending(RequestId requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(requestId) != 0;
}

std::size_t VrfCoordinator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<PendingDraw> VrfCoordinator::pendingDraw(RequestId requestId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace raffle
