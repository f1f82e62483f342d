#include <doctest/doctest.h>

#include <statuscast/web/Metrics.hpp>

#include <chrono>
#include <string>

using namespace std::chrono_literals;
using namespace SC;

TEST_SUITE("web.metrics") {

TEST_CASE("requests are counted per route with errors") {
    MetricsCollector metrics;
    metrics.record_request(RouteMetric::Restart, 200, 3ms);
    metrics.record_request(RouteMetric::Restart, 409, 1ms);
    metrics.record_request(RouteMetric::Config, 0, 500us);

    auto snapshot = metrics.capture_snapshot();
    auto restart  = snapshot.routes[static_cast<std::size_t>(RouteMetric::Restart)];
    CHECK(restart.total == 2);
    CHECK(restart.errors == 1);
    CHECK(restart.latency.count == 2);
    CHECK(restart.latency.sum_micros == 4000);
    CHECK(restart.latency.buckets[0] == 1);
    CHECK(restart.latency.buckets[1] == 1);

    auto config = snapshot.routes[static_cast<std::size_t>(RouteMetric::Config)];
    CHECK(config.total == 1);
    CHECK(config.errors == 0);
}

TEST_CASE("stream and restart counters") {
    MetricsCollector metrics;
    metrics.record_sse_connection_open();
    metrics.record_sse_connection_open();
    metrics.record_sse_connection_close();
    metrics.record_sse_event("status");
    metrics.record_sse_event("heartbeat");
    metrics.record_sse_event("heartbeat");
    metrics.record_restart_decision(RestartDecision::Accepted);
    metrics.record_restart_decision(RestartDecision::RejectedInProgress);
    metrics.record_restart_outcome(RestartOutcome::TimedOut);

    auto snapshot = metrics.capture_snapshot();
    CHECK(snapshot.sse_connections_current == 1);
    CHECK(snapshot.sse_connections_total == 2);
    CHECK(snapshot.restarts_accepted == 1);
    CHECK(snapshot.restarts_rejected == 1);
    CHECK(snapshot.restarts_timed_out == 1);
    CHECK(snapshot.restarts_succeeded == 0);

    auto json = metrics.snapshot_json(snapshot);
    CHECK(json["sse"]["connections_current"] == 1);
    CHECK(json["restarts"]["timed_out"] == 1);
    REQUIRE(json["sse_events"].size() == 2);
    CHECK(json["sse_events"][0]["type"] == "heartbeat");
    CHECK(json["sse_events"][0]["count"] == 2);

    auto text = metrics.render_prometheus(snapshot);
    CHECK(text.find("statuscast_sse_connections 1\n") != std::string::npos);
    CHECK(text.find("statuscast_sse_events_total{type=\"status\"} 1") != std::string::npos);
    CHECK(text.find("statuscast_restarts_rejected_total 1\n") != std::string::npos);
    CHECK(text.find("statuscast_request_duration_seconds_bucket{route=\"status_stream\"") != std::string::npos);
}

}
