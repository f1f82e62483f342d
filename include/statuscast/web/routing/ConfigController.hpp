#pragma once

#include <functional>
#include <memory>

#include <statuscast/web/Metrics.hpp>
#include <statuscast/web/StatusServerOptions.hpp>
#include <statuscast/web/TabCatalog.hpp>
#include <statuscast/web/routing/HttpHelpers.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

namespace SC {

namespace detail {

inline auto health_payload(char const* status, bool ready) -> nlohmann::ordered_json {
    return nlohmann::ordered_json{{"status", status}, {"ready", ready}};
}

inline void handle_config_request(HttpRequestContext& ctx, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::Config, res};
    write_json_response(res, ctx.catalog.to_response(), 200);
}

inline void handle_readyz_request(HttpRequestContext& ctx, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::Readyz, res};
    if (ctx.draining.load(std::memory_order_acquire)) {
        write_json_response(res, health_payload("shutting down", false), 503, true);
        return;
    }
    write_json_response(res, health_payload("ready", true), 200, true);
}

} // namespace detail

/**
 * Serves the tab configuration, the Kubernetes probes, the drain hook and
 * the Prometheus scrape endpoint.
 *
 * Drain requires `Authorization: Bearer <drain key>` and hands over to the
 * supplied drain action, which flips readiness to 503 and closes every open
 * stream.
 */
class ConfigController {
public:
    static auto Create(HttpRequestContext& ctx, std::function<void()> on_drain)
        -> std::unique_ptr<ConfigController> {
        return std::unique_ptr<ConfigController>(new ConfigController(ctx, std::move(on_drain)));
    }

    void register_routes(httplib::Server& server) {
        server.Get("/api/config", [this](httplib::Request const&, httplib::Response& res) {
            detail::handle_config_request(ctx_, res);
        });

        server.Get("/health/healthz", [this](httplib::Request const&, httplib::Response& res) {
            [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Healthz, res};
            write_json_response(res, detail::health_payload("alive", true), 200, true);
        });

        server.Get("/health/readyz", [this](httplib::Request const&, httplib::Response& res) {
            detail::handle_readyz_request(ctx_, res);
        });

        server.Get("/health/drain", [this](httplib::Request const& req, httplib::Response& res) {
            handle_drain_request(req, res);
        });

        server.Get("/metrics", [this](httplib::Request const&, httplib::Response& res) {
            [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Metrics, res};
            res.status = 200;
            res.set_content(ctx_.metrics.render_prometheus(), "text/plain; version=0.0.4");
            res.set_header("Cache-Control", "no-store");
        });
    }

private:
    ConfigController(HttpRequestContext& ctx, std::function<void()> on_drain)
        : ctx_(ctx)
        , on_drain_(std::move(on_drain)) {}

    void handle_drain_request(httplib::Request const& req, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Drain, res};
        auto const& key = ctx_.options.drain_auth_key;
        if (key.empty() || req.get_header_value("Authorization") != "Bearer " + key) {
            write_json_response(res, detail::health_payload("unauthorized", false), 401, true);
            return;
        }
        if (on_drain_) {
            on_drain_();
        } else {
            ctx_.draining.store(true, std::memory_order_release);
        }
        write_json_response(res, detail::health_payload("alive", true), 200, true);
    }

    HttpRequestContext&   ctx_;
    std::function<void()> on_drain_;
};

} // namespace SC
