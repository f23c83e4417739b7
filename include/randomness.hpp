#pragma once

#include "config.hpp"
#include "types.hpp"

#include <vector>

namespace raffle {

// Receiving side of the request/fulfillment protocol. The client delivers words
// through rawFulfillRandomWords, which only accepts the configured client identity.
class RandomnessConsumer {
public:
    explicit RandomnessConsumer(Address randomnessClient);
    virtual ~RandomnessConsumer() = default;

    void rawFulfillRandomWords(const Address& caller,
                               RequestId requestId,
                               const std::vector<RandomWord>& randomWords);

    const Address& randomnessClient() const { return randomnessClient_; }

protected:
    virtual void fulfillRandomWords(RequestId requestId,
                                    const std::vector<RandomWord>& randomWords) = 0;

private:
    Address randomnessClient_;
};

// Issues draw requests and later calls back the consumer exactly once per request.
// Correlation state lives here, not in the consumer.
class RandomnessClient {
public:
    virtual ~RandomnessClient() = default;

    virtual const Address& identity() const = 0;
    virtual RequestId requestDraw(const RequestParameters& params,
                                  RandomnessConsumer& consumer) = 0;
};

} // namespace raffle
