#include <statuscast/web/streaming/StreamEncoder.hpp>

#include <nlohmann/json.hpp>

#include <type_traits>
#include <variant>

namespace SC {

auto status_payload_json(StatusPayload const& payload) -> std::string {
    auto const dump = [](std::string const& text) {
        // Invalid UTF-8 is replaced rather than thrown from inside the stream writer.
        return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    };
    auto const state   = dump(std::string{status_state_name(payload.state())});
    auto const message = payload.message() ? dump(*payload.message()) : std::string{"null"};

    std::string body;
    body.reserve(state.size() + message.size() + 24);
    body.append("{\"state\": ");
    body.append(state);
    body.append(", \"message\": ");
    body.append(message);
    body.push_back('}');
    return body;
}

auto format_status_event(StatusPayload const& payload, int retry_ms) -> std::string {
    std::string frame;
    frame.append("retry: ");
    frame.append(std::to_string(retry_ms));
    frame.append("\nevent: status\ndata: ");
    frame.append(status_payload_json(payload));
    frame.append("\n\n");
    return frame;
}

auto format_heartbeat_event(int retry_ms) -> std::string {
    std::string frame;
    frame.append("retry: ");
    frame.append(std::to_string(retry_ms));
    frame.append("\nevent: heartbeat\ndata: {}\n\n");
    return frame;
}

auto encode_channel_event(ChannelEvent const& event, int retry_ms) -> std::optional<std::string> {
    return std::visit(
        [retry_ms](auto const& value) -> std::optional<std::string> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, StatusPayload>) {
                return format_status_event(value, retry_ms);
            } else if constexpr (std::is_same_v<T, HeartbeatEvent>) {
                return format_heartbeat_event(retry_ms);
            } else {
                static_assert(std::is_same_v<T, ClosedEvent>);
                return std::nullopt;
            }
        },
        event);
}

} // namespace SC
