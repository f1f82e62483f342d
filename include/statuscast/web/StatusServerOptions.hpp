#pragma once

#include <statuscast/core/Error.hpp>
#include <statuscast/status/HeartbeatConfig.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SC {

struct StatusServerOptions {
    std::string                 host{"127.0.0.1"};
    int                         port{8080};
    std::string                 tabs_config_path{"tabs.json"};
    std::string                 environment{"development"};
    std::optional<std::int64_t> heartbeat_interval_seconds;
    std::int64_t                restart_timeout_seconds{180};
    std::string                 kube_api_server;
    std::string                 kube_token_file;
    std::string                 kube_ca_cert_file;
    bool                        kube_insecure_skip_tls_verify{false};
    std::int64_t                kube_poll_interval_ms{1000};
    int                         worker_threads{64};
    std::string                 drain_auth_key;
    bool                        show_help{false};
};

inline constexpr std::int64_t kDevelopmentHeartbeatSeconds = 5;
inline constexpr std::int64_t kProductionHeartbeatSeconds  = 30;

auto ParseStatusServerArguments(int argc, char** argv) -> std::optional<StatusServerOptions>;

void PrintStatusServerUsage();

bool ApplyStatusServerEnvOverrides(StatusServerOptions& options);

auto ValidateStatusServerOptions(StatusServerOptions const& options) -> std::optional<std::string>;

bool IsValidStatusServerPort(int port);
bool IsValidStatusServerEnvironment(std::string_view environment);

// Explicit interval if set, otherwise 30s in production and 5s elsewhere.
auto EffectiveHeartbeatSeconds(StatusServerOptions const& options) -> std::int64_t;
auto ResolveHeartbeatConfig(StatusServerOptions const& options) -> Expected<HeartbeatConfig>;

} // namespace SC
