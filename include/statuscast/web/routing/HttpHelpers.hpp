#pragma once

#include <statuscast/core/Error.hpp>
#include <statuscast/status/HeartbeatConfig.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace SC {

class TabCatalog;
class ChannelRegistry;
class RestartCoordinator;
class MetricsCollector;
struct StatusServerOptions;

struct HttpRequestContext {
    TabCatalog const&          catalog;
    ChannelRegistry&           registry;
    RestartCoordinator&        coordinator;
    MetricsCollector&          metrics;
    StatusServerOptions const& options;
    HeartbeatConfig            heartbeat;
    std::atomic<bool>&         draining;
};

void write_json_response(httplib::Response&            res,
                         nlohmann::ordered_json const& payload,
                         int                           status,
                         bool                          no_store = false);

void write_error_response(httplib::Response& res, std::string_view code, std::string_view message, int status);

// Maps an Error to its HTTP status and writes {"error": ..., "message": ...}.
void respond_error(httplib::Response& res, Error const& error);
void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);

[[nodiscard]] auto http_status_for(Error::Code code) -> int;

// Tab index captured by the first regex group of the route.
auto parse_tab_index(httplib::Request const& req) -> std::optional<std::size_t>;

} // namespace SC
