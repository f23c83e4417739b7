#include "randomness.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace raffle {

RandomnessConsumer::RandomnessConsumer(Address randomnessClient)
    : randomnessClient_(std::move(randomnessClient)) {
    if (randomnessClient_.empty()) {
        throw std::invalid_argument("randomness client identity must not be empty");
    }
}

void RandomnessConsumer::rawFulfillRandomWords(const Address& caller,
                                               RequestId requestId,
                                               const std::vector<RandomWord>& randomWords) {
    if (caller != randomnessClient_) {
        throw UnauthorizedFulfillerError(caller, randomnessClient_);
    }
    if (randomWords.empty()) {
        throw std::invalid_argument("fulfillment must carry at least one random word");
    }
    fulfillRandomWords(requestId, randomWords);
}

} // namespace raffle
