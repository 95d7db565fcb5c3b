#pragma once

#include "../utils/logger.h"

#include <chrono>
#include <cstdint>
#include <string>

struct UpstreamTarget {
    std::string scheme = "https";
    std::string host = "api.openai.com";
    std::uint16_t port = 443;

    bool use_tls() const { return scheme == "https"; }
    // host, plus ":port" when the port is not the scheme default
    std::string authority() const;
    std::string origin() const { return scheme + "://" + authority(); }
};

// Parses "http[s]://host[:port][/]". Throws std::invalid_argument.
UpstreamTarget parse_upstream_url(const std::string& p_url);

struct GatewayConfig {
    // proxy listener
    std::string host = "localhost";
    std::uint16_t port = 8080;
    std::uint16_t h2_port = 0;     // 0 disables the HTTP/2 listener
    std::string cert_file;         // TLS for the HTTP/2 listener when both are set
    std::string key_file;
    std::string proxied_prefix = "/v1/";
    std::size_t max_body_bytes = 64 * 1024 * 1024;

    // trace listener
    std::uint16_t trace_port = 8081;
    std::size_t history_size = 100;
    std::size_t hub_queue_capacity = 1024;
    // Live messages a viewer may have queued on top of the history replay.
    std::size_t observer_queue_limit = 256;

    // hooks
    std::string hook_script;
    std::chrono::milliseconds script_timeout{10000};

    // upstream transport
    UpstreamTarget upstream;
    std::chrono::seconds upstream_timeout{30};
    std::size_t max_idle_connections = 100;
    std::size_t max_idle_per_host = 10;
    std::chrono::seconds idle_timeout{30};

    int threads = 4;
    LogLevel log_level = LogLevel::Info;
    bool print_sample_hook = false;
    bool show_help = false;
};

// Flags override environment variables, which override the defaults.
// Throws std::invalid_argument on malformed input.
GatewayConfig parse_config(int argc, const char* const argv[]);

void print_usage(const char* p_program);
