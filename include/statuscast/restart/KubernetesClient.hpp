#pragma once

#include <statuscast/restart/OrchestrationClient.hpp>
#include <statuscast/util/UrlView.hpp>

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace SC {

struct KubernetesClientOptions {
    // Empty means in-cluster discovery through KUBERNETES_SERVICE_HOST/PORT.
    std::string               api_server;
    std::string               token_file;
    std::string               ca_cert_file;
    bool                      insecure_skip_tls_verify = false;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::seconds      request_timeout{10};
};

struct KubernetesConnection {
    UrlView     endpoint;
    std::string bearer_token;
    std::string ca_cert_file;
    bool        verify_tls = true;
    std::chrono::seconds request_timeout{10};
};

struct KubernetesHttpResponse {
    int         status{0};
    std::string body;
};

/**
 * apps/v1 Deployment client for rollout restarts.
 *
 * trigger_restart patches the pod template restartedAt annotation and reports
 * the resulting metadata.generation. watch_rollout polls the Deployment and
 * evaluates it with evaluate_rollout().
 */
class KubernetesClient final : public OrchestrationClient {
public:
    static constexpr char const* kServiceAccountDir = "/var/run/secrets/kubernetes.io/serviceaccount";

    static auto Create(KubernetesClientOptions const& options) -> Expected<std::unique_ptr<KubernetesClient>>;

    auto trigger_restart(DeploymentRef const& target) -> Expected<std::int64_t> override;
    auto watch_rollout(DeploymentRef const& target, std::int64_t target_generation)
        -> Expected<std::unique_ptr<RolloutWatch>> override;

    auto read_deployment(DeploymentRef const& target) -> Expected<nlohmann::json>;

    [[nodiscard]] auto connection() const -> KubernetesConnection const& { return connection_; }

private:
    KubernetesClient(KubernetesConnection connection, std::chrono::milliseconds poll_interval);

    auto send(std::string const& method,
              std::string const& path,
              std::string const& body,
              std::string const& content_type) -> Expected<KubernetesHttpResponse>;

    KubernetesConnection      connection_;
    std::chrono::milliseconds poll_interval_;
};

auto deployment_path(DeploymentRef const& target) -> std::string;
auto restart_patch_body(std::chrono::system_clock::time_point now) -> nlohmann::json;

} // namespace SC
