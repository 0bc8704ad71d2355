#include "config.hpp"
#include "stop_request.hpp"
#include "subscriber_session.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("nats_pull",
        "Pull messages from a JetStream consumer with lease management");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("nats_pull");

    // Load config
    pull::config cfg;
    try {
        cfg = pull::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("verbose")) cfg.log_level = "debug";

    spdlog::set_level(pull::parse_log_level(cfg.log_level).value_or(spdlog::level::info));

    console->info("nats_pull starting");
    console->info("  server:  {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  deliver: {}", cfg.deliver_subject);
    console->info("  flush:   every {}ms (first after {}ms)",
                  cfg.lease.flush_period.count(), cfg.lease.flush_start.count());
    console->info("  extend:  every {}ms (first after {}ms)",
                  cfg.lease.extend_period.count(), cfg.lease.extend_start.count());

    // Single-threaded io_context (NATS I/O + lease loop), run on its own
    // thread so main can wait for the final flush.
    asio::io_context ioc(1);
    auto work = asio::make_work_guard(ioc);

    // Every delivered message is logged and acknowledged.
    pull::subscriber_session session(
        ioc, cfg,
        [console](pull::received_message msg, pull::ack_handler handler) {
            console->debug("Received {} bytes on '{}'", msg.payload.size(), msg.subject);
            handler.ack();
        },
        console);

    // Graceful shutdown: close the session on the io thread, then let main
    // wait for lease management to flush.
    pull::stop_request stop([&](std::string_view reason) {
        console->info("Shutting down ({})...", reason);
        session.close();
    });

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto ec, auto) {
        if (ec) return;
        stop.request("signal");
    });

    // Build NATS connect config
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;

    // SSL config
    std::optional<nats_asio::ssl_config> ssl_conf;
    if (!cfg.tls_cert.empty()) {
        nats_asio::ssl_config sc;
        sc.cert = cfg.tls_cert;
        sc.key  = cfg.tls_key;
        sc.ca   = cfg.tls_ca;
        sc.verify = true;
        ssl_conf = sc;
    }

    // Callbacks
    auto on_connected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->info("Connected to NATS");
        co_return;
    };

    auto on_disconnected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->warn("Disconnected from NATS");
        co_return;
    };

    auto on_error = [console](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
        console->error("NATS connection error: {}", err);
        co_return;
    };

    auto conn = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, ssl_conf);

    conn->start(nats_cfg);

    // Start the session once connected
    asio::co_spawn(ioc,
        [&, c = conn]() mutable -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (!c->is_connected()) {
                timer.expires_after(std::chrono::milliseconds(100));
                co_await timer.async_wait(asio::use_awaitable);
            }
            if (!co_await session.start(c)) {
                stop.request("session failed to start", 1);
            }
        },
        asio::detached
    );

    std::thread io_thread([&ioc] { ioc.run(); });

    // Shutdown ordering:
    // 1. Wait for the signal (or a failed start); the session has stopped
    //    accepting messages.
    int rc = stop.wait();

    // 2. Wait for pending acks to be flushed and leased messages nacked.
    try {
        session.wait_closed();
    } catch (const std::exception& e) {
        console->error("Lease management failed: {}", e.what());
        rc = 1;
    }

    // 3. Stop the io_context.
    work.reset();
    ioc.stop();
    io_thread.join();

    console->info("nats_pull stopped");
    return rc;
}
