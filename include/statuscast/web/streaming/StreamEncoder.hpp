#pragma once

#include <statuscast/status/BroadcastChannel.hpp>
#include <statuscast/status/StatusPayload.hpp>

#include <optional>
#include <string>

namespace SC {

inline constexpr int kStreamRetryMilliseconds = 3000;

// {"state": "...", "message": ...} with the spacing observers already parse.
auto status_payload_json(StatusPayload const& payload) -> std::string;

auto format_status_event(StatusPayload const& payload, int retry_ms = kStreamRetryMilliseconds) -> std::string;
auto format_heartbeat_event(int retry_ms = kStreamRetryMilliseconds) -> std::string;

// Wire bytes for one channel event; std::nullopt for ClosedEvent, which ends the stream.
auto encode_channel_event(ChannelEvent const& event, int retry_ms = kStreamRetryMilliseconds)
    -> std::optional<std::string>;

} // namespace SC
