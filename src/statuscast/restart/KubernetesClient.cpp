#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <statuscast/restart/DeploymentReadiness.hpp>
#include <statuscast/restart/KubernetesClient.hpp>
#include <statuscast/util/TimeUtils.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace SC {

namespace {

using json = nlohmann::json;

auto read_text_file(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(Error{Error::Code::IoFailure, "unable to read " + path.string()});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto text = buffer.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

auto resolve_endpoint(KubernetesClientOptions const& options) -> Expected<std::string> {
    if (!options.api_server.empty()) {
        return options.api_server;
    }
    auto const* host = std::getenv("KUBERNETES_SERVICE_HOST");
    if (host == nullptr || *host == '\0') {
        return std::unexpected(Error{Error::Code::NotConfigured,
                                     "no Kubernetes API server configured and not running in-cluster"});
    }
    std::string port = "443";
    if (auto const* env_port = std::getenv("KUBERNETES_SERVICE_PORT"); env_port != nullptr && *env_port != '\0') {
        port = env_port;
    }
    std::string host_text{host};
    if (host_text.find(':') != std::string::npos) {
        host_text = "[" + host_text + "]";
    }
    return "https://" + host_text + ":" + port;
}

auto make_http_client(KubernetesConnection const& connection) -> std::unique_ptr<httplib::ClientImpl> {
    std::unique_ptr<httplib::ClientImpl> client;
    auto const& url = connection.endpoint;
    if (url.tls) {
        auto ssl_client = std::make_unique<httplib::SSLClient>(url.host, url.port);
        ssl_client->enable_server_certificate_verification(connection.verify_tls);
        if (connection.verify_tls && !connection.ca_cert_file.empty()) {
            ssl_client->set_ca_cert_path(connection.ca_cert_file);
        }
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    auto const timeout_seconds = static_cast<time_t>(connection.request_timeout.count());
    client->set_connection_timeout(timeout_seconds, 0);
    client->set_read_timeout(timeout_seconds, 0);
    client->set_write_timeout(timeout_seconds, 0);
    client->set_follow_location(false);
    client->set_keep_alive(false);
    if (!connection.bearer_token.empty()) {
        client->set_bearer_token_auth(connection.bearer_token);
    }
    return client;
}

auto status_reason(KubernetesHttpResponse const& response) -> std::string {
    auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object()) {
        auto it = body.find("reason");
        if (it != body.end() && it->is_string() && !it->get_ref<std::string const&>().empty()) {
            return it->get<std::string>();
        }
    }
    return httplib::status_message(response.status);
}

auto is_success(int status) -> bool {
    return status >= 200 && status < 300;
}

class PollingRolloutWatch final : public RolloutWatch {
public:
    PollingRolloutWatch(KubernetesClient& client,
                        DeploymentRef             target,
                        std::int64_t              target_generation,
                        std::chrono::milliseconds poll_interval)
        : client_{client}
        , target_{std::move(target)}
        , target_generation_{target_generation}
        , poll_interval_{poll_interval} {}

    auto next(std::chrono::steady_clock::time_point deadline) -> Expected<std::optional<RolloutSignal>> override {
        if (polled_once_) {
            auto const wake = std::min(saturating_deadline(last_poll_, poll_interval_), deadline);
            std::this_thread::sleep_until(wake);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::optional<RolloutSignal>{};
        }
        polled_once_ = true;
        last_poll_   = std::chrono::steady_clock::now();

        auto deployment = client_.read_deployment(target_);
        if (!deployment) {
            return std::unexpected(deployment.error());
        }
        auto signal = evaluate_rollout(*deployment, target_generation_);
        sc_log("Rollout poll " + target_.describe() + " -> "
                   + std::to_string(static_cast<int>(signal.kind)),
               "Kubernetes", "DEBUG");
        return std::optional<RolloutSignal>{std::move(signal)};
    }

private:
    KubernetesClient&                     client_;
    DeploymentRef                         target_;
    std::int64_t                          target_generation_;
    std::chrono::milliseconds             poll_interval_;
    std::chrono::steady_clock::time_point last_poll_{};
    bool                                  polled_once_ = false;
};

} // namespace

auto deployment_path(DeploymentRef const& target) -> std::string {
    return "/apis/apps/v1/namespaces/" + target.namespace_name + "/deployments/" + target.deployment;
}

auto restart_patch_body(std::chrono::system_clock::time_point now) -> json {
    return json{{"spec",
                 {{"template",
                   {{"metadata", {{"annotations", {{"kubectl.kubernetes.io/restartedAt", format_timestamp(now)}}}}}}}}}};
}

auto KubernetesClient::Create(KubernetesClientOptions const& options) -> Expected<std::unique_ptr<KubernetesClient>> {
    auto endpoint_text = resolve_endpoint(options);
    if (!endpoint_text) {
        return std::unexpected(endpoint_text.error());
    }
    auto endpoint = parse_url(*endpoint_text);
    if (!endpoint) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "invalid Kubernetes API server URL: " + *endpoint_text});
    }

    std::filesystem::path const service_account{kServiceAccountDir};
    auto const                  in_cluster = options.api_server.empty();

    KubernetesConnection connection;
    connection.endpoint        = std::move(*endpoint);
    connection.verify_tls      = !options.insecure_skip_tls_verify;
    connection.request_timeout = options.request_timeout;
    connection.ca_cert_file    = options.ca_cert_file;
    if (connection.ca_cert_file.empty() && in_cluster) {
        connection.ca_cert_file = (service_account / "ca.crt").string();
    }

    std::filesystem::path token_path = options.token_file;
    if (token_path.empty() && in_cluster) {
        token_path = service_account / "token";
    }
    if (!token_path.empty()) {
        auto token = read_text_file(token_path);
        if (!token) {
            return std::unexpected(Error{Error::Code::NotConfigured, errorMessageOr(token.error(), "token unavailable")});
        }
        connection.bearer_token = std::move(*token);
    }

    if (!connection.verify_tls) {
        sc_log("TLS verification disabled for Kubernetes API " + connection.endpoint.host, "Kubernetes", "WARNING");
    }
    return std::unique_ptr<KubernetesClient>(new KubernetesClient(std::move(connection), options.poll_interval));
}

KubernetesClient::KubernetesClient(KubernetesConnection connection, std::chrono::milliseconds poll_interval)
    : connection_{std::move(connection)}
    , poll_interval_{poll_interval} {}

auto KubernetesClient::send(std::string const& method,
                            std::string const& path,
                            std::string const& body,
                            std::string const& content_type) -> Expected<KubernetesHttpResponse> {
    auto             client = make_http_client(connection_);
    httplib::Headers headers{{"Accept", "application/json"}};
    auto const       full_path = connection_.endpoint.path + path;

    httplib::Result response = method == "PATCH" ? client->Patch(full_path, headers, body, content_type)
                                                 : client->Get(full_path, headers);
    if (!response) {
        return std::unexpected(Error{Error::Code::ExternalOrchestrationFailure,
                                     method + " " + path + " failed: " + httplib::to_string(response.error())});
    }
    return KubernetesHttpResponse{response->status, response->body};
}

auto KubernetesClient::trigger_restart(DeploymentRef const& target) -> Expected<std::int64_t> {
    auto const path = deployment_path(target);
    auto const body = restart_patch_body(std::chrono::system_clock::now()).dump();
    sc_log("Patching " + target.describe() + " with restartedAt", "Kubernetes", "DEBUG");

    auto patched = send("PATCH", path, body, "application/strategic-merge-patch+json");
    if (!patched) {
        return std::unexpected(Error{Error::Code::ExternalOrchestrationFailure,
                                     "Kubernetes API error: " + errorMessageOr(patched.error(), "request failed")});
    }
    if (!is_success(patched->status)) {
        return std::unexpected(
            Error{Error::Code::ExternalOrchestrationFailure, "Kubernetes API error: " + status_reason(*patched)});
    }

    auto status = send("GET", path + "/status", {}, {});
    if (!status) {
        return std::unexpected(Error{Error::Code::ExternalOrchestrationFailure,
                                     "failed to read deployment status: "
                                         + errorMessageOr(status.error(), "request failed")});
    }
    if (!is_success(status->status)) {
        return std::unexpected(Error{Error::Code::ExternalOrchestrationFailure,
                                     "failed to read deployment status: " + status_reason(*status)});
    }

    auto document = json::parse(status->body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::unexpected(Error{Error::Code::ExternalOrchestrationFailure,
                                     "failed to read deployment status: malformed response"});
    }
    auto metadata = document.find("metadata");
    if (metadata == document.end() || !metadata->is_object()) {
        return std::unexpected(
            Error{Error::Code::ExternalOrchestrationFailure, "unable to determine deployment generation"});
    }
    auto generation = metadata->find("generation");
    if (generation == metadata->end() || !generation->is_number_integer()) {
        return std::unexpected(
            Error{Error::Code::ExternalOrchestrationFailure, "unable to determine deployment generation"});
    }
    return generation->get<std::int64_t>();
}

auto KubernetesClient::read_deployment(DeploymentRef const& target) -> Expected<json> {
    auto response = send("GET", deployment_path(target), {}, {});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!is_success(response->status)) {
        return std::unexpected(
            Error{Error::Code::ExternalOrchestrationFailure, "Kubernetes API error: " + status_reason(*response)});
    }
    auto document = json::parse(response->body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "malformed deployment document"});
    }
    return document;
}

auto KubernetesClient::watch_rollout(DeploymentRef const& target, std::int64_t target_generation)
    -> Expected<std::unique_ptr<RolloutWatch>> {
    sc_log("Watching rollout " + target.describe() + " target generation " + std::to_string(target_generation),
           "Kubernetes", "DEBUG");
    return std::unique_ptr<RolloutWatch>(
        std::make_unique<PollingRolloutWatch>(*this, target, target_generation, poll_interval_));
}

} // namespace SC
