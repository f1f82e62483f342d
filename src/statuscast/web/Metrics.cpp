#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <statuscast/util/TimeUtils.hpp>
#include <statuscast/web/Metrics.hpp>

#include <cmath>
#include <sstream>
#include <utility>

namespace SC {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::Config, "config"},
        {RouteMetric::Restart, "restart"},
        {RouteMetric::StatusStream, "status_stream"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Readyz, "readyz"},
        {RouteMetric::Drain, "drain"},
        {RouteMetric::Metrics, "metrics"},
    }};

void write_counter(std::ostringstream& out, char const* name, char const* help, std::uint64_t value) {
    out << "# HELP " << name << ' ' << help << "\n";
    out << "# TYPE " << name << " counter\n";
    out << name << ' ' << value << "\n";
}

} // namespace

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void MetricsCollector::record_request(RouteMetric route,
                                      int         status,
                                      std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int effective_status = status == 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_sse_connection_open() {
    sse_connections_current_.fetch_add(1, std::memory_order_relaxed);
    sse_connections_total_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_sse_connection_close() {
    sse_connections_current_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsCollector::record_sse_event(std::string_view event_type) {
    std::lock_guard const lock{sse_event_mutex_};
    sse_event_counts_[std::string{event_type}] += 1;
}

void MetricsCollector::record_restart_decision(RestartDecision decision) {
    switch (decision) {
    case RestartDecision::Accepted:
        restarts_accepted_.fetch_add(1, std::memory_order_relaxed);
        break;
    case RestartDecision::RejectedInProgress:
        restarts_rejected_.fetch_add(1, std::memory_order_relaxed);
        break;
    }
}

void MetricsCollector::record_restart_outcome(RestartOutcome outcome) {
    switch (outcome) {
    case RestartOutcome::Succeeded:
        restarts_succeeded_.fetch_add(1, std::memory_order_relaxed);
        break;
    case RestartOutcome::Failed:
        restarts_failed_.fetch_add(1, std::memory_order_relaxed);
        break;
    case RestartOutcome::TimedOut:
        restarts_timed_out_.fetch_add(1, std::memory_order_relaxed);
        break;
    }
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total   = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors  = routes_[i].errors.load(std::memory_order_relaxed);
    }
    snapshot.sse_connections_current = sse_connections_current_.load(std::memory_order_relaxed);
    snapshot.sse_connections_total   = sse_connections_total_.load(std::memory_order_relaxed);
    snapshot.restarts_accepted       = restarts_accepted_.load(std::memory_order_relaxed);
    snapshot.restarts_rejected       = restarts_rejected_.load(std::memory_order_relaxed);
    snapshot.restarts_succeeded      = restarts_succeeded_.load(std::memory_order_relaxed);
    snapshot.restarts_failed         = restarts_failed_.load(std::memory_order_relaxed);
    snapshot.restarts_timed_out      = restarts_timed_out_.load(std::memory_order_relaxed);

    {
        std::lock_guard const lock{sse_event_mutex_};
        snapshot.sse_events.reserve(sse_event_counts_.size());
        for (auto const& entry : sse_event_counts_) {
            snapshot.sse_events.push_back(MetricsSnapshot::SseEventEntry{entry.first, entry.second});
        }
    }

    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;

    out << "# HELP statuscast_request_duration_seconds Request latency histogram\n";
    out << "# TYPE statuscast_request_duration_seconds histogram\n";
    auto const& buckets = Histogram::bucket_boundaries();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const&   route_stats = snapshot.routes[i];
        auto const*   name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative  = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            auto boundary = buckets[b];
            out << "statuscast_request_duration_seconds_bucket{route=\"" << name
                << "\",le=\"" << (std::isinf(boundary) ? std::string{"+Inf"}
                                                           : std::to_string(boundary / 1000.0))
                << "\"} " << cumulative << "\n";
        }
        double sum_seconds = static_cast<double>(route_stats.latency.sum_micros) / 1'000'000.0;
        out << "statuscast_request_duration_seconds_sum{route=\"" << name << "\"} " << sum_seconds << "\n";
        out << "statuscast_request_duration_seconds_count{route=\"" << name << "\"} "
            << route_stats.latency.count << "\n";
    }

    out << "# HELP statuscast_requests_total Total HTTP requests\n";
    out << "# TYPE statuscast_requests_total counter\n";
    out << "# HELP statuscast_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE statuscast_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "statuscast_requests_total{route=\"" << name << "\"} " << snapshot.routes[i].total << "\n";
        out << "statuscast_request_errors_total{route=\"" << name << "\"} " << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP statuscast_sse_connections Current status stream connections\n";
    out << "# TYPE statuscast_sse_connections gauge\n";
    out << "statuscast_sse_connections " << snapshot.sse_connections_current << "\n";
    write_counter(out, "statuscast_sse_connections_total", "Total status stream connections opened",
                  snapshot.sse_connections_total);

    if (!snapshot.sse_events.empty()) {
        out << "# HELP statuscast_sse_events_total Stream events emitted by type\n";
        out << "# TYPE statuscast_sse_events_total counter\n";
        for (auto const& entry : snapshot.sse_events) {
            out << "statuscast_sse_events_total{type=\"" << entry.type << "\"} " << entry.count << "\n";
        }
    }

    write_counter(out, "statuscast_restarts_accepted_total", "Restart requests accepted",
                  snapshot.restarts_accepted);
    write_counter(out, "statuscast_restarts_rejected_total", "Restart requests rejected as already in progress",
                  snapshot.restarts_rejected);
    write_counter(out, "statuscast_restarts_succeeded_total", "Restarts that reached a ready rollout",
                  snapshot.restarts_succeeded);
    write_counter(out, "statuscast_restarts_failed_total", "Restarts that ended with an orchestration failure",
                  snapshot.restarts_failed);
    write_counter(out, "statuscast_restarts_timed_out_total", "Restarts that exceeded the rollout ceiling",
                  snapshot.restarts_timed_out);

    write_counter(out, "statuscast_metrics_scrapes_total", "Metrics scrapes",
                  metrics_scrapes_.load(std::memory_order_relaxed));

    return out.str();
}

auto MetricsCollector::snapshot_json() const -> json {
    auto snapshot = capture_snapshot();
    return snapshot_json(snapshot);
}

auto MetricsCollector::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = format_timestamp(snapshot.captured_at);

    json request_stats;
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name   = kRouteMetricNames[i].second;
        auto const& stats  = snapshot.routes[i];
        double      avg_ms = stats.latency.count == 0
                                 ? 0.0
                                 : static_cast<double>(stats.latency.sum_micros) / 1000.0
                                       / static_cast<double>(stats.latency.count);
        request_stats[name] = json{{"total", stats.total}, {"errors", stats.errors}, {"avg_ms", avg_ms}};
    }
    payload["requests"] = std::move(request_stats);

    payload["sse"] = json{{"connections_current", snapshot.sse_connections_current},
                          {"connections_total", snapshot.sse_connections_total}};

    payload["restarts"] = json{{"accepted", snapshot.restarts_accepted},
                               {"rejected", snapshot.restarts_rejected},
                               {"succeeded", snapshot.restarts_succeeded},
                               {"failed", snapshot.restarts_failed},
                               {"timed_out", snapshot.restarts_timed_out}};

    json sse_events = json::array();
    for (auto const& entry : snapshot.sse_events) {
        sse_events.push_back(json{{"type", entry.type}, {"count", entry.count}});
    }
    payload["sse_events"] = std::move(sse_events);

    return payload;
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector&  metrics,
                                         RouteMetric        route,
                                         httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_,
                            response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace SC
