#include <statuscast/web/StatusServerOptions.hpp>

#include <statuscast/util/UrlView.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace SC {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

bool is_http_url(std::string_view value) {
    return parse_url(value).has_value();
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

// Durations beyond this cannot be added to a steady_clock time point.
constexpr std::int64_t kMaxSeconds = HeartbeatConfig::kMaxIntervalSeconds;

} // namespace

bool IsValidStatusServerPort(int port) {
    return port > 0 && port <= 65535;
}

bool IsValidStatusServerEnvironment(std::string_view environment) {
    return environment == "development" || environment == "production" || environment == "testing";
}

auto EffectiveHeartbeatSeconds(StatusServerOptions const& options) -> std::int64_t {
    if (options.heartbeat_interval_seconds) {
        return *options.heartbeat_interval_seconds;
    }
    return options.environment == "production" ? kProductionHeartbeatSeconds : kDevelopmentHeartbeatSeconds;
}

auto ResolveHeartbeatConfig(StatusServerOptions const& options) -> Expected<HeartbeatConfig> {
    return HeartbeatConfig::FromSeconds(EffectiveHeartbeatSeconds(options));
}

auto ValidateStatusServerOptions(StatusServerOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidStatusServerPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.tabs_config_path.empty()) {
        return std::string{"--tabs-config must not be empty"};
    }
    if (!IsValidStatusServerEnvironment(options.environment)) {
        return std::string{"--env must be one of development, testing, production"};
    }
    if (options.heartbeat_interval_seconds
        && (*options.heartbeat_interval_seconds <= 0 || *options.heartbeat_interval_seconds > kMaxSeconds)) {
        return std::string{"--heartbeat-interval must be a positive number of seconds"};
    }
    if (options.restart_timeout_seconds <= 0 || options.restart_timeout_seconds > kMaxSeconds) {
        return std::string{"--restart-timeout must be > 0"};
    }
    if (!options.kube_api_server.empty() && !is_http_url(options.kube_api_server)) {
        return std::string{"--kube-api-server must be an http(s) URL"};
    }
    if (options.kube_poll_interval_ms <= 0) {
        return std::string{"--kube-poll-interval-ms must be > 0"};
    }
    if (options.worker_threads <= 0) {
        return std::string{"--worker-threads must be > 0"};
    }
    return std::nullopt;
}

bool ApplyStatusServerEnvOverrides(StatusServerOptions& options) {
    auto apply_string_env = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    auto apply_positive_i64 = [&](char const* key, std::int64_t& target) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, 1, kMaxSeconds, parsed)) {
                std::cerr << key << " must be a positive integer\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_string_env("STATUSCAST_HOST", options.host)) {
        return false;
    }

    if (!apply_env("STATUSCAST_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "STATUSCAST_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_string_env("STATUSCAST_TABS_CONFIG", options.tabs_config_path)) {
        return false;
    }

    if (!apply_env("STATUSCAST_ENV", [&](std::string_view value) {
            if (!IsValidStatusServerEnvironment(value)) {
                std::cerr << "STATUSCAST_ENV must be one of development, testing, production\n";
                return false;
            }
            options.environment = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("STATUSCAST_SSE_HEARTBEAT_INTERVAL", [&](std::string_view value) {
            std::int64_t parsed = 0;
            if (!parse_integer_in_range<std::int64_t>(value, 1, kMaxSeconds, parsed)) {
                std::cerr << "STATUSCAST_SSE_HEARTBEAT_INTERVAL must be a positive number of seconds\n";
                return false;
            }
            options.heartbeat_interval_seconds = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_positive_i64("STATUSCAST_RESTART_TIMEOUT", options.restart_timeout_seconds)) {
        return false;
    }

    if (!apply_env("STATUSCAST_KUBE_API_SERVER", [&](std::string_view value) {
            if (!is_http_url(value)) {
                std::cerr << "STATUSCAST_KUBE_API_SERVER must be an http(s) URL\n";
                return false;
            }
            options.kube_api_server = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_string_env("STATUSCAST_KUBE_TOKEN_FILE", options.kube_token_file)) {
        return false;
    }
    if (!apply_string_env("STATUSCAST_KUBE_CA_FILE", options.kube_ca_cert_file)) {
        return false;
    }

    if (!apply_env("STATUSCAST_KUBE_INSECURE_SKIP_TLS_VERIFY", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "STATUSCAST_KUBE_INSECURE_SKIP_TLS_VERIFY must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.kube_insecure_skip_tls_verify = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_positive_i64("STATUSCAST_KUBE_POLL_INTERVAL_MS", options.kube_poll_interval_ms)) {
        return false;
    }

    if (!apply_string_env("STATUSCAST_DRAIN_AUTH_KEY", options.drain_auth_key)) {
        return false;
    }

    if (!apply_env("STATUSCAST_WORKER_THREADS", [&](std::string_view value) {
            int parsed = options.worker_threads;
            if (!parse_integer_in_range<int>(value, 1, 4096, parsed)) {
                std::cerr << "STATUSCAST_WORKER_THREADS must be within 1-4096\n";
                return false;
            }
            options.worker_threads = parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintStatusServerUsage() {
    std::cout << "Usage: statuscast_server [options]\n"
              << "  --host <host>                 Bind address (default 127.0.0.1)\n"
              << "  --port <port>                 Bind port (default 8080)\n"
              << "  --tabs-config <path>          Tab configuration JSON file (default tabs.json)\n"
              << "  --env <name>                  development|testing|production (default development)\n"
              << "  --heartbeat-interval <sec>    SSE heartbeat interval (default 5, 30 in production)\n"
              << "  --restart-timeout <sec>       Rollout ceiling per restart (default 180)\n"
              << "  --kube-api-server <url>       Kubernetes API server (default: in-cluster)\n"
              << "  --kube-token-file <path>      Bearer token file for the API server\n"
              << "  --kube-ca-file <path>         CA bundle for the API server certificate\n"
              << "  --kube-insecure-skip-tls-verify  Disable API server certificate verification\n"
              << "  --kube-poll-interval-ms <ms>  Rollout poll cadence (default 1000)\n"
              << "  --worker-threads <n>          HTTP worker threads; bounds concurrent streams (default 64)\n"
              << "  --drain-auth-key <key>        Bearer key accepted by /health/drain (disabled when unset)\n"
              << "  --help                        Show this help\n";
}

std::optional<StatusServerOptions> ParseStatusServerArguments(int argc, char** argv) {
    StatusServerOptions options{};
    if (!ApplyStatusServerEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_string = [&](int& index, std::string_view flag, std::string& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << flag << " must not be empty\n";
            return false;
        }
        target = std::string{*value};
        return true;
    };

    auto parse_positive_i64 = [&](int& index, std::string_view flag, std::int64_t& target) {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, 1, kMaxSeconds, parsed)) {
            std::cerr << flag << " must be a positive integer\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (!parse_string(i, "--host", options.host)) {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--tabs-config") {
            if (!parse_string(i, "--tabs-config", options.tabs_config_path)) {
                return std::nullopt;
            }
        } else if (arg == "--env") {
            if (auto value = require_value(i, "--env")) {
                if (!IsValidStatusServerEnvironment(*value)) {
                    std::cerr << "--env must be one of development, testing, production\n";
                    return std::nullopt;
                }
                options.environment = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--heartbeat-interval") {
            std::int64_t parsed = EffectiveHeartbeatSeconds(options);
            if (!parse_positive_i64(i, "--heartbeat-interval", parsed)) {
                return std::nullopt;
            }
            options.heartbeat_interval_seconds = parsed;
        } else if (arg == "--restart-timeout") {
            if (!parse_positive_i64(i, "--restart-timeout", options.restart_timeout_seconds)) {
                return std::nullopt;
            }
        } else if (arg == "--kube-api-server") {
            if (auto value = require_value(i, "--kube-api-server")) {
                if (!is_http_url(*value)) {
                    std::cerr << "--kube-api-server must be an http(s) URL\n";
                    return std::nullopt;
                }
                options.kube_api_server = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--kube-token-file") {
            if (!parse_string(i, "--kube-token-file", options.kube_token_file)) {
                return std::nullopt;
            }
        } else if (arg == "--kube-ca-file") {
            if (!parse_string(i, "--kube-ca-file", options.kube_ca_cert_file)) {
                return std::nullopt;
            }
        } else if (arg == "--kube-insecure-skip-tls-verify") {
            options.kube_insecure_skip_tls_verify = true;
        } else if (arg == "--kube-poll-interval-ms") {
            if (!parse_positive_i64(i, "--kube-poll-interval-ms", options.kube_poll_interval_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--worker-threads") {
            if (auto value = require_value(i, "--worker-threads")) {
                int parsed = options.worker_threads;
                if (!parse_integer_in_range<int>(*value, 1, 4096, parsed)) {
                    std::cerr << "--worker-threads must be within 1-4096\n";
                    return std::nullopt;
                }
                options.worker_threads = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--drain-auth-key") {
            if (!parse_string(i, "--drain-auth-key", options.drain_auth_key)) {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateStatusServerOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace SC
