#include "core/config.h"
#include "core/server.h"
#include "hooks/hook_manager.hpp"
#include "trace/trace_hub.hpp"
#include "trace/trace_server.hpp"
#include "transport/active_request.hpp"
#include "transport/forwarding_pipeline.hpp"
#include "transport/http1_proxy.hpp"
#include "transport/http_client.hpp"
#include "utils/logger.h"
#include <boost/asio.hpp>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

namespace {

void wait_for_signals(boost::asio::signal_set& p_signals, std::function<void()> p_shutdown,
                      HookManager& p_hooks, const std::string& p_hook_script) {
    p_signals.async_wait([&p_signals, p_shutdown, &p_hooks, p_hook_script](const boost::system::error_code& ec,
                                                                           int signum) {
        if (ec) {
            return;
        }
        if (signum == SIGHUP) {
            if (p_hook_script.empty()) {
                LOG_WARN("SIGHUP received but no hook script is configured");
            } else if (p_hooks.script_path().empty()) {
                // The startup load failed; try again from scratch.
                if (!p_hooks.try_load_file(p_hook_script)) {
                    LOG_WARN("Still running without hooks");
                }
            } else {
                LOG_INFO("SIGHUP received, reloading " << p_hooks.script_path());
                try {
                    if (p_hooks.reload()) {
                        LOG_INFO("Hook script reloaded");
                    }
                } catch (const HookLoadError& e) {
                    LOG_ERROR("Reload failed (" << to_string(e.reason()) << "), keeping previous script: " << e.what());
                }
            }
            wait_for_signals(p_signals, p_shutdown, p_hooks, p_hook_script);
            return;
        }
        LOG_INFO("Received signal " << signum << ", shutting down...");
        ActiveRequestManager::instance().log_statistics();
        p_shutdown();
    });
}

} // namespace

int main(int argc, char* argv[]) {
    GatewayConfig config;
    try {
        config = parse_config(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (config.print_sample_hook) {
        std::cout << HookManager::sample_script();
        return 0;
    }

    try {
        Logger::instance().set_level(config.log_level);

        LOG_INFO("Starting tracegate");
        LOG_INFO("Proxy: " << config.host << ":" << config.port << " -> " << config.upstream.origin()
                 << ", trace port: " << config.trace_port << ", threads: " << config.threads);

        HookManager hooks(config.script_timeout);
        if (!config.hook_script.empty()) {
            if (!hooks.try_load_file(config.hook_script)) {
                LOG_WARN("Running without hooks");
            }
        }

        TraceHub hub(config.history_size, config.hub_queue_capacity);

        boost::asio::io_context io_context(config.threads);

        HttpClient client(io_context, config);
        ForwardingPipeline pipeline(config, client, hooks, hub);

        Http1ProxyServer http1_proxy(io_context, config.host, config.port, pipeline);
        TraceServer trace_server(io_context, config, hub, hooks);

        std::unique_ptr<Server> h2_server;
        if (config.h2_port != 0) {
            if (config.cert_file.empty()) {
                h2_server = std::make_unique<Server>(io_context, config.host, config.h2_port, pipeline);
            } else {
                h2_server = std::make_unique<Server>(io_context, config.host, config.h2_port,
                                                     config.cert_file, config.key_file, pipeline);
            }
        }

        auto shutdown = [&]() {
            http1_proxy.stop();
            trace_server.stop();
            if (h2_server) {
                h2_server->stop();
            }
            io_context.stop();
        };
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM, SIGHUP);
        wait_for_signals(signals, shutdown, hooks, config.hook_script);

        http1_proxy.start();
        trace_server.start();
        if (h2_server) {
            h2_server->start();
        }

        // Run with multiple threads
        std::vector<std::thread> thread_pool;
        thread_pool.reserve(config.threads);

        for (int i = 0; i < config.threads - 1; ++i) {
            thread_pool.emplace_back([&io_context]() {
                io_context.run();
            });
        }

        LOG_INFO("Proxy ready on http://" << config.host << ":" << http1_proxy.port() << config.proxied_prefix);
        LOG_INFO("Trace viewer endpoints on http://" << config.host << ":" << trace_server.port());

        // Run on main thread
        io_context.run();

        // Wait for all threads
        for (auto& t : thread_pool) {
            if (t.joinable()) {
                t.join();
            }
        }

        hub.stop();
        LOG_INFO("Server shutdown complete");

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " << e.what());
        return 1;
    }

    return 0;
}
