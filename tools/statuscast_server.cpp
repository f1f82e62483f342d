#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <statuscast/restart/KubernetesClient.hpp>
#include <statuscast/web/StatusServer.hpp>

#include "log/TaggedLogger.hpp"

namespace {

void handle_signal(int) {
    SC::RequestStatusServerStop();
}

// Stands in when no tab is restartable, so no cluster access is needed.
class NoOrchestrationClient final : public SC::OrchestrationClient {
public:
    auto trigger_restart(SC::DeploymentRef const& target) -> SC::Expected<std::int64_t> override {
        return std::unexpected(SC::Error{SC::Error::Code::NotConfigured,
                                         "no orchestration client for " + target.describe()});
    }

    auto watch_rollout(SC::DeploymentRef const& target, std::int64_t)
        -> SC::Expected<std::unique_ptr<SC::RolloutWatch>> override {
        return std::unexpected(SC::Error{SC::Error::Code::NotConfigured,
                                         "no orchestration client for " + target.describe()});
    }
};

void configure_logging() {
#ifdef SC_LOG_DEBUG
    std::string_view mode;
    if (char const* value = std::getenv("STATUSCAST_LOG")) {
        mode = value;
    }
    SC::set_logging_enabled(mode != "0");
    SC::set_debug_logging_enabled(mode == "debug");
    SC::set_thread_name("Main");
#endif
}

auto has_restartable_tab(SC::TabCatalog const& catalog) -> bool {
    for (auto const& tab : catalog.tabs()) {
        if (tab.restartable()) {
            return true;
        }
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = SC::ParseStatusServerArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        SC::PrintStatusServerUsage();
        return EXIT_SUCCESS;
    }

    configure_logging();

    auto catalog = SC::TabCatalog::LoadFile(options.tabs_config_path);
    if (!catalog) {
        std::cerr << "[statuscast] " << SC::describeError(catalog.error()) << '\n';
        return EXIT_FAILURE;
    }

    std::unique_ptr<SC::OrchestrationClient> client;
    if (has_restartable_tab(*catalog)) {
        SC::KubernetesClientOptions kube_options;
        kube_options.api_server               = options.kube_api_server;
        kube_options.token_file               = options.kube_token_file;
        kube_options.ca_cert_file             = options.kube_ca_cert_file;
        kube_options.insecure_skip_tls_verify = options.kube_insecure_skip_tls_verify;
        kube_options.poll_interval            = std::chrono::milliseconds{options.kube_poll_interval_ms};

        auto kube = SC::KubernetesClient::Create(kube_options);
        if (!kube) {
            std::cerr << "[statuscast] restartable tabs are configured but the Kubernetes client is unavailable: "
                      << SC::describeError(kube.error()) << '\n';
            return EXIT_FAILURE;
        }
        client = std::move(*kube);
    } else {
        client = std::make_unique<NoOrchestrationClient>();
    }

    SC::ResetStatusServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto status = SC::RunStatusServer(std::move(*catalog), *client, options);
#ifdef SC_LOG_DEBUG
    SC::flush_log();
#endif
    return status;
}
