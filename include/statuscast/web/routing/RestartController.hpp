#pragma once

#include <memory>

#include <statuscast/restart/RestartCoordinator.hpp>
#include <statuscast/web/Metrics.hpp>
#include <statuscast/web/TabCatalog.hpp>
#include <statuscast/web/routing/HttpHelpers.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <string>

namespace SC {

namespace detail {

inline void handle_restart_request(HttpRequestContext&     ctx,
                                   httplib::Request const& req,
                                   httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::Restart, res};

    auto index = parse_tab_index(req);
    if (!index) {
        respond_bad_request(res, "invalid tab index");
        return;
    }

    auto tab = ctx.catalog.require_restartable(*index);
    if (!tab) {
        respond_error(res, tab.error());
        return;
    }

    auto const key      = channel_key_for(*tab, *index);
    auto const decision = ctx.coordinator.request_restart(key, *tab->k8s);
    ctx.metrics.record_restart_decision(decision);
    switch (decision) {
    case RestartDecision::Accepted:
        write_json_response(res,
                            nlohmann::ordered_json{{"status", "restarting"},
                                                   {"message", nullptr}},
                            200,
                            true);
        return;
    case RestartDecision::RejectedInProgress:
        respond_error(res,
                      Error{Error::Code::RestartInProgress,
                            "restart already in progress (" + tab->k8s->describe() + ")"});
        return;
    }
}

} // namespace detail

class RestartController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<RestartController> {
        return std::unique_ptr<RestartController>(new RestartController(ctx));
    }

    void register_routes(httplib::Server& server) {
        server.Post(R"(/api/restart/(\d+))",
                    [this](httplib::Request const& req, httplib::Response& res) {
                        detail::handle_restart_request(ctx_, req, res);
                    });
    }

private:
    explicit RestartController(HttpRequestContext& ctx)
        : ctx_(ctx) {}

    HttpRequestContext& ctx_;
};

} // namespace SC
