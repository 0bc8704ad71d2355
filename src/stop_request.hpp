#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <string_view>
#include <utility>

namespace pull {

// One-shot process stop, shared by the signal handler and startup failures.
//
// The first request() runs `on_stop` and releases wait(); later requests
// are ignored and do not change the exit code.
class stop_request {
public:
    explicit stop_request(std::function<void(std::string_view reason)> on_stop)
        : m_on_stop(std::move(on_stop)), m_stopped(m_promise.get_future()) {}

    stop_request(const stop_request&) = delete;
    stop_request& operator=(const stop_request&) = delete;

    // Returns false if a stop was already requested.
    bool request(std::string_view reason, int exit_code = 0) {
        if (m_requested.exchange(true, std::memory_order_acq_rel)) return false;

        m_exit_code = exit_code;
        m_on_stop(reason);
        m_promise.set_value();
        return true;
    }

    bool requested() const { return m_requested.load(std::memory_order_acquire); }

    // Block until the first request() completed. Returns its exit code.
    int wait() {
        m_stopped.wait();
        return m_exit_code;
    }

private:
    std::function<void(std::string_view)> m_on_stop;
    std::atomic<bool> m_requested{false};
    int m_exit_code = 0;
    std::promise<void> m_promise;
    std::future<void> m_stopped;
};

} // namespace pull
