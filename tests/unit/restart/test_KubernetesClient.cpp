#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <doctest/doctest.h>

#include <statuscast/restart/KubernetesClient.hpp>
#include <statuscast/util/UrlView.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

using namespace std::chrono_literals;
using namespace SC;
using json = nlohmann::json;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct TokenFile {
    explicit TokenFile(std::string const& contents)
        : path(std::filesystem::temp_directory_path()
               / ("statuscast-token-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))) {
        std::ofstream output(path);
        output << contents;
    }

    ~TokenFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::filesystem::path path;
};

// Minimal apps/v1 API serving one Deployment named default/api.
class FakeApiServer {
public:
    FakeApiServer() {
        auto const base = std::string{"/apis/apps/v1/namespaces/default/deployments/api"};
        server_.Patch(base, [this](httplib::Request const& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            patch_body_         = req.body;
            patch_content_type_ = req.get_header_value("Content-Type");
            authorization_      = req.get_header_value("Authorization");
            res.status          = patch_status_;
            res.set_content(patch_response_, "application/json");
        });
        server_.Get(base + "/status", [this](httplib::Request const&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            res.set_content(status_document_.dump(), "application/json");
        });
        server_.Get(base, [this](httplib::Request const&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++deployment_reads_;
            res.set_content(deployment_document_.dump(), "application/json");
        });

        port_   = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeApiServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    auto url() const -> std::string { return "http://127.0.0.1:" + std::to_string(port_); }

    void reject_patch(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        patch_status_   = status;
        patch_response_ = std::move(body);
    }

    void set_status_document(json document) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_document_ = std::move(document);
    }

    void set_deployment_document(json document) {
        std::lock_guard<std::mutex> lock(mutex_);
        deployment_document_ = std::move(document);
    }

    auto patch_body() -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return patch_body_;
    }

    auto patch_content_type() -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return patch_content_type_;
    }

    auto authorization() -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return authorization_;
    }

    auto deployment_reads() -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return deployment_reads_;
    }

private:
    httplib::Server server_;
    std::thread     thread_;
    int             port_{0};

    std::mutex  mutex_;
    int         patch_status_{200};
    std::string patch_response_{"{}"};
    json        status_document_{{"metadata", {{"generation", 8}}}};
    json        deployment_document_{{"metadata", {{"generation", 8}}}, {"status", {{"observedGeneration", 7}}}};
    std::string patch_body_;
    std::string patch_content_type_;
    std::string authorization_;
    int         deployment_reads_{0};
};

auto ready_deployment(std::int64_t generation) -> json {
    return json{{"metadata", {{"generation", generation}}},
                {"spec", {{"replicas", 2}}},
                {"status",
                 {{"observedGeneration", generation},
                  {"readyReplicas", 2},
                  {"availableReplicas", 2},
                  {"updatedReplicas", 2}}}};
}

auto make_client(FakeApiServer const& api, TokenFile const& token) -> std::unique_ptr<KubernetesClient> {
    KubernetesClientOptions options;
    options.api_server    = api.url();
    options.token_file    = token.path.string();
    options.poll_interval = 50ms;
    auto client           = KubernetesClient::Create(options);
    REQUIRE(client.has_value());
    return std::move(*client);
}

DeploymentRef const kApi{"default", "api"};

} // namespace

TEST_SUITE("restart.kubernetes_client") {

TEST_CASE("deployment path and restart patch") {
    CHECK(deployment_path(kApi) == "/apis/apps/v1/namespaces/default/deployments/api");

    auto body = restart_patch_body(std::chrono::system_clock::time_point{std::chrono::seconds{1714564800}});
    CHECK(body["spec"]["template"]["metadata"]["annotations"]["kubectl.kubernetes.io/restartedAt"]
          == "2024-05-01T12:00:00.000Z");
}

TEST_CASE("API server URLs are parsed into endpoint parts") {
    auto https = parse_url("https://kubernetes.default.svc");
    REQUIRE(https.has_value());
    CHECK(https->tls);
    CHECK(https->port == 443);
    CHECK(https->host == "kubernetes.default.svc");

    auto prefixed = parse_url("http://127.0.0.1:8001/k8s/");
    REQUIRE(prefixed.has_value());
    CHECK_FALSE(prefixed->tls);
    CHECK(prefixed->port == 8001);
    CHECK(prefixed->path == "/k8s");

    auto ipv6 = parse_url("https://[fd00::1]:6443");
    REQUIRE(ipv6.has_value());
    CHECK(ipv6->host == "fd00::1");
    CHECK(ipv6->port == 6443);

    CHECK_FALSE(parse_url("ftp://example.com").has_value());
    CHECK_FALSE(parse_url("https://host:99999").has_value());
    CHECK_FALSE(parse_url("no-scheme").has_value());
}

TEST_CASE("creation without a cluster or server URL fails") {
    EnvGuard host{"KUBERNETES_SERVICE_HOST", nullptr};
    auto     client = KubernetesClient::Create(KubernetesClientOptions{});
    REQUIRE_FALSE(client.has_value());
    CHECK(client.error().code == Error::Code::NotConfigured);
}

TEST_CASE("creation fails when the token file is unreadable") {
    KubernetesClientOptions options;
    options.api_server = "https://127.0.0.1:6443";
    options.token_file = "/nonexistent/statuscast/token";
    auto client        = KubernetesClient::Create(options);
    REQUIRE_FALSE(client.has_value());
    CHECK(client.error().code == Error::Code::NotConfigured);
}

TEST_CASE("trigger patches restartedAt and returns the new generation") {
    FakeApiServer api;
    TokenFile     token{"secret-token\n"};
    auto          client = make_client(api, token);
    CHECK(client->connection().verify_tls);
    CHECK(client->connection().bearer_token == "secret-token");

    auto generation = client->trigger_restart(kApi);
    REQUIRE(generation.has_value());
    CHECK(*generation == 8);

    CHECK(api.authorization() == "Bearer secret-token");
    CHECK(api.patch_content_type() == "application/strategic-merge-patch+json");
    auto patch = json::parse(api.patch_body());
    CHECK(patch["spec"]["template"]["metadata"]["annotations"].contains("kubectl.kubernetes.io/restartedAt"));
}

TEST_CASE("rejected patch surfaces the API reason") {
    FakeApiServer api;
    TokenFile     token{"secret-token"};
    auto          client = make_client(api, token);
    api.reject_patch(403, R"({"kind":"Status","reason":"Forbidden"})");

    auto generation = client->trigger_restart(kApi);
    REQUIRE_FALSE(generation.has_value());
    CHECK(generation.error().code == Error::Code::ExternalOrchestrationFailure);
    CHECK(generation.error().message == std::optional<std::string>{"Kubernetes API error: Forbidden"});
}

TEST_CASE("status without a generation is reported") {
    FakeApiServer api;
    TokenFile     token{"secret-token"};
    auto          client = make_client(api, token);
    api.set_status_document(json{{"metadata", json::object()}});

    auto generation = client->trigger_restart(kApi);
    REQUIRE_FALSE(generation.has_value());
    CHECK(generation.error().message == std::optional<std::string>{"unable to determine deployment generation"});
}

TEST_CASE("unreachable API server is an orchestration failure") {
    TokenFile               token{"secret-token"};
    KubernetesClientOptions options;
    options.api_server      = "http://127.0.0.1:1";
    options.token_file      = token.path.string();
    options.request_timeout = std::chrono::seconds{1};
    auto client             = KubernetesClient::Create(options);
    REQUIRE(client.has_value());

    auto generation = (*client)->trigger_restart(kApi);
    REQUIRE_FALSE(generation.has_value());
    CHECK(generation.error().code == Error::Code::ExternalOrchestrationFailure);
    CHECK(generation.error().message->starts_with("Kubernetes API error: "));
}

TEST_CASE("watch polls until the rollout is ready") {
    FakeApiServer api;
    TokenFile     token{"secret-token"};
    auto          client = make_client(api, token);

    auto watch = client->watch_rollout(kApi, 8);
    REQUIRE(watch.has_value());

    auto const deadline = std::chrono::steady_clock::now() + 5s;
    auto       first    = (*watch)->next(deadline);
    REQUIRE(first.has_value());
    REQUIRE(first->has_value());
    CHECK((*first)->kind == RolloutSignalKind::NotReady);

    api.set_deployment_document(ready_deployment(8));
    auto second = (*watch)->next(deadline);
    REQUIRE(second.has_value());
    REQUIRE(second->has_value());
    CHECK((*second)->kind == RolloutSignalKind::Ready);
    CHECK(api.deployment_reads() == 2);

    SUBCASE("an expired deadline yields no signal") {
        auto expired = (*watch)->next(std::chrono::steady_clock::now());
        REQUIRE(expired.has_value());
        CHECK_FALSE(expired->has_value());
    }
}

}
