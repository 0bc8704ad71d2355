#pragma once

#include <string>

namespace pull {

enum class ack_action {
    ack,
    nack
};

// An application's decision about one message, on its way to the lease loop.
struct ack_result {
    ack_action action = ack_action::ack;
    std::string ack_id;

    bool operator==(const ack_result&) const = default;
};

} // namespace pull
