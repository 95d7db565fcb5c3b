#include "config.h"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

unsigned long parse_number(const std::string& p_name, const std::string& p_value,
                           unsigned long p_min, unsigned long p_max) {
    std::size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(p_value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + p_name + ": '" + p_value + "'");
    }
    if (consumed != p_value.size() || p_value[0] == '-' || value < p_min || value > p_max) {
        throw std::invalid_argument("invalid value for " + p_name + ": '" + p_value + "'");
    }
    return value;
}

std::uint16_t parse_port(const std::string& p_name, const std::string& p_value, bool p_allow_zero) {
    return static_cast<std::uint16_t>(parse_number(p_name, p_value, p_allow_zero ? 0 : 1, 65535));
}

const char* env(const char* p_name) {
    const char* value = std::getenv(p_name);
    return (value && *value) ? value : nullptr;
}

void apply_environment(GatewayConfig& p_config) {
    if (auto v = env("HOST")) p_config.host = v;
    if (auto v = env("PORT")) p_config.port = parse_port("PORT", v, false);
    if (auto v = env("TRACE_PORT")) p_config.trace_port = parse_port("TRACE_PORT", v, false);
    if (auto v = env("H2_PORT")) p_config.h2_port = parse_port("H2_PORT", v, true);
    if (auto v = env("CERT_FILE")) p_config.cert_file = v;
    if (auto v = env("KEY_FILE")) p_config.key_file = v;
    if (auto v = env("HOOK_SCRIPT")) p_config.hook_script = v;
    if (auto v = env("UPSTREAM_URL")) p_config.upstream = parse_upstream_url(v);
    if (auto v = env("THREADS")) p_config.threads = static_cast<int>(parse_number("THREADS", v, 1, 256));
    if (auto v = env("LOG_LEVEL")) p_config.log_level = Logger::parse_level(v);
}

} // namespace

std::string UpstreamTarget::authority() const {
    const std::uint16_t default_port = use_tls() ? 443 : 80;
    if (port == default_port) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

UpstreamTarget parse_upstream_url(const std::string& p_url) {
    UpstreamTarget target;
    auto scheme_end = p_url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("upstream URL must start with http:// or https://: " + p_url);
    }
    target.scheme = p_url.substr(0, scheme_end);
    if (target.scheme != "http" && target.scheme != "https") {
        throw std::invalid_argument("unsupported upstream scheme: " + target.scheme);
    }

    std::string rest = p_url.substr(scheme_end + 3);
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        if (rest.substr(slash) != "/") {
            throw std::invalid_argument("upstream URL must not carry a path: " + p_url);
        }
        rest = rest.substr(0, slash);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(']') == std::string::npos) {
        target.host = rest.substr(0, colon);
        target.port = parse_port("upstream port", rest.substr(colon + 1), false);
    } else {
        target.host = rest;
        target.port = target.use_tls() ? 443 : 80;
    }
    if (target.host.empty()) {
        throw std::invalid_argument("upstream URL has no host: " + p_url);
    }
    return target;
}

GatewayConfig parse_config(int argc, const char* const argv[]) {
    GatewayConfig config;
    apply_environment(config);

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--print-sample-hook") {
            config.print_sample_hook = true;
        } else if (arg == "--host") {
            config.host = next();
        } else if (arg == "--port") {
            config.port = parse_port(arg, next(), false);
        } else if (arg == "--trace-port") {
            config.trace_port = parse_port(arg, next(), false);
        } else if (arg == "--h2-port") {
            config.h2_port = parse_port(arg, next(), true);
        } else if (arg == "--cert") {
            config.cert_file = next();
        } else if (arg == "--key") {
            config.key_file = next();
        } else if (arg == "--hook") {
            config.hook_script = next();
        } else if (arg == "--upstream") {
            config.upstream = parse_upstream_url(next());
        } else if (arg == "--timeout") {
            config.upstream_timeout = std::chrono::seconds(parse_number(arg, next(), 1, 3600));
        } else if (arg == "--script-timeout-ms") {
            config.script_timeout = std::chrono::milliseconds(parse_number(arg, next(), 0, 3600000));
        } else if (arg == "--history-size") {
            config.history_size = parse_number(arg, next(), 1, 1000000);
        } else if (arg == "--threads") {
            config.threads = static_cast<int>(parse_number(arg, next(), 1, 256));
        } else if (arg == "--max-body") {
            config.max_body_bytes = parse_number(arg, next(), 1, std::numeric_limits<unsigned long>::max());
        } else if (arg == "--log-level") {
            config.log_level = Logger::parse_level(next());
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    if (config.cert_file.empty() != config.key_file.empty()) {
        throw std::invalid_argument("--cert and --key must be given together");
    }
    return config;
}

void print_usage(const char* p_program) {
    std::cout << "Usage: " << p_program << " [OPTIONS]\n";
    std::cout << "Options:\n";
    std::cout << "  --host <host>             Proxy listen address (default: localhost, env HOST)\n";
    std::cout << "  --port <port>             Proxy listen port (default: 8080, env PORT)\n";
    std::cout << "  --trace-port <port>       Trace viewer port for /traces, /ws, /health (default: 8081, env TRACE_PORT)\n";
    std::cout << "  --h2-port <port>          HTTP/2 proxy listen port, 0 disables (default: 0, env H2_PORT)\n";
    std::cout << "  --cert <file>             Certificate for the HTTP/2 listener (env CERT_FILE)\n";
    std::cout << "  --key <file>              Private key for the HTTP/2 listener (env KEY_FILE)\n";
    std::cout << "  --hook <file>             Lua script with processRequest/processResponse (env HOOK_SCRIPT)\n";
    std::cout << "  --upstream <url>          Upstream origin (default: https://api.openai.com, env UPSTREAM_URL)\n";
    std::cout << "  --timeout <seconds>       Upstream timeout (default: 30)\n";
    std::cout << "  --script-timeout-ms <ms>  Lua execution budget per hook call, 0 disables (default: 10000)\n";
    std::cout << "  --history-size <n>        Traces kept in memory (default: 100)\n";
    std::cout << "  --threads <n>             I/O threads (default: 4, env THREADS)\n";
    std::cout << "  --max-body <bytes>        Largest accepted request body (default: 67108864)\n";
    std::cout << "  --log-level <level>       debug, info, warn, error or off (default: info, env LOG_LEVEL)\n";
    std::cout << "  --print-sample-hook       Print a sample Lua hook script and exit\n";
    std::cout << "  -h, --help                Show this help\n";
    std::cout << "\nSend SIGHUP to reload the hook script.\n";
}
