#pragma once

#include <asio/awaitable.hpp>
#include <string>
#include <vector>

namespace pull {

// Performs the network side of lease management.
//
// Calls are best effort: the lease engine does not retry them or look at
// their outcome. Implementations deal with their own failures.
class leaser {
public:
    virtual ~leaser() = default;

    // Acknowledge a batch of messages.
    virtual asio::awaitable<void> ack(std::vector<std::string> ack_ids) = 0;

    // Reject a batch of messages so the server redelivers them.
    virtual asio::awaitable<void> nack(std::vector<std::string> ack_ids) = 0;

    // Push out the redelivery deadline of a batch of messages.
    virtual asio::awaitable<void> extend(std::vector<std::string> ack_ids) = 0;
};

} // namespace pull
