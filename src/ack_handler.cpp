#include "ack_handler.hpp"
#include <utility>

namespace pull {

ack_handler::ack_handler(std::string ack_id, channel_sender<ack_result> ack_tx)
    : m_ack_id(std::move(ack_id)), m_ack_tx(std::move(ack_tx))
{}

ack_handler::~ack_handler() {
    resolve(ack_action::nack);
}

ack_handler::ack_handler(ack_handler&& other) noexcept
    : m_ack_id(std::move(other.m_ack_id)), m_ack_tx(std::move(other.m_ack_tx))
{}

ack_handler& ack_handler::operator=(ack_handler&& other) noexcept {
    if (this != &other) {
        resolve(ack_action::nack);
        m_ack_id = std::move(other.m_ack_id);
        m_ack_tx = std::move(other.m_ack_tx);
    }
    return *this;
}

void ack_handler::ack() {
    resolve(ack_action::ack);
}

void ack_handler::nack() {
    resolve(ack_action::nack);
}

void ack_handler::resolve(ack_action action) {
    if (m_ack_tx.is_closed()) return;

    // A failed send means the lease loop is gone; nothing left to tell.
    m_ack_tx.send(ack_result{action, m_ack_id});
    m_ack_tx.close();
}

} // namespace pull
