#pragma once

#include "ack_result.hpp"
#include "channel.hpp"
#include <string>

namespace pull {

// Lets the application acknowledge or reject one message (at-least-once).
//
// Call ack() when the message was processed. Calling nack(), or destroying
// the handler without a decision, rejects it and the server redelivers the
// message, possibly to another client. Acknowledgements are best effort.
class ack_handler {
public:
    ack_handler(std::string ack_id, channel_sender<ack_result> ack_tx);
    ~ack_handler();

    ack_handler(ack_handler&& other) noexcept;
    ack_handler& operator=(ack_handler&& other) noexcept;
    ack_handler(const ack_handler&) = delete;
    ack_handler& operator=(const ack_handler&) = delete;

    void ack();
    void nack();

    const std::string& ack_id() const { return m_ack_id; }

    // False once a decision was sent.
    bool pending() const { return !m_ack_tx.is_closed(); }

private:
    void resolve(ack_action action);

    std::string m_ack_id;
    channel_sender<ack_result> m_ack_tx;
};

} // namespace pull
