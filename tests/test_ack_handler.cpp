#include "ack_handler.hpp"
#include <gtest/gtest.h>
#include <optional>

namespace {

struct decisions {
    decisions() : decisions(pull::make_channel<pull::ack_result>([] {})) {}

    std::optional<pull::ack_result> next() {
        pull::ack_result r;
        if (rx.try_receive(r) != pull::receive_status::received) return std::nullopt;
        return r;
    }

    pull::channel_sender<pull::ack_result> tx;
    pull::channel_receiver<pull::ack_result> rx;

private:
    explicit decisions(std::pair<pull::channel_sender<pull::ack_result>,
                                 pull::channel_receiver<pull::ack_result>> ch)
        : tx(std::move(ch.first)), rx(std::move(ch.second)) {}
};

const pull::ack_result ack_1{pull::ack_action::ack, "001"};
const pull::ack_result nack_1{pull::ack_action::nack, "001"};

} // namespace

TEST(ack_handler, ack) {
    decisions d;
    pull::ack_handler h("001", d.tx);
    EXPECT_FALSE(d.next().has_value());
    EXPECT_TRUE(h.pending());

    h.ack();
    EXPECT_EQ(d.next(), ack_1);
    EXPECT_FALSE(h.pending());
}

TEST(ack_handler, nack) {
    decisions d;
    pull::ack_handler h("001", d.tx);

    h.nack();
    EXPECT_EQ(d.next(), nack_1);
}

TEST(ack_handler, drop_nacks) {
    decisions d;
    {
        pull::ack_handler h("001", d.tx);
        EXPECT_EQ(h.ack_id(), "001");
    }
    EXPECT_EQ(d.next(), nack_1);
    EXPECT_FALSE(d.next().has_value());
}

TEST(ack_handler, resolves_once) {
    decisions d;
    {
        pull::ack_handler h("001", d.tx);
        h.ack();
        h.nack();
        h.ack();
    }
    EXPECT_EQ(d.next(), ack_1);
    EXPECT_FALSE(d.next().has_value());
}

TEST(ack_handler, move_transfers_decision) {
    decisions d;
    {
        pull::ack_handler h("001", d.tx);
        pull::ack_handler moved(std::move(h));
        EXPECT_TRUE(moved.pending());
        EXPECT_FALSE(h.pending());
        moved.ack();
    }
    EXPECT_EQ(d.next(), ack_1);
    EXPECT_FALSE(d.next().has_value());
}

TEST(ack_handler, move_assignment_nacks_replaced_message) {
    decisions d;
    pull::ack_handler a("001", d.tx);
    pull::ack_handler b("002", d.tx);

    a = std::move(b);
    EXPECT_EQ(d.next(), nack_1);
    EXPECT_EQ(a.ack_id(), "002");

    a.ack();
    EXPECT_EQ(d.next(), (pull::ack_result{pull::ack_action::ack, "002"}));
}

TEST(ack_handler, drop_after_lease_loop_is_gone_does_not_wake_it) {
    int notified = 0;
    std::optional<pull::ack_handler> handler;
    {
        auto [sender, receiver] = pull::make_channel<pull::ack_result>([&] { ++notified; });
        handler.emplace("001", std::move(sender));
    }

    // Unresolved: the destructor nacks into a channel nobody reads.
    handler.reset();
    EXPECT_EQ(notified, 0);
}

TEST(ack_handler, ignores_missing_lease_loop) {
    auto tx = [] {
        auto [sender, receiver] = pull::make_channel<pull::ack_result>([] {});
        return std::move(sender);
    }();

    pull::ack_handler h("001", tx);
    h.ack();
    EXPECT_FALSE(h.pending());
}
