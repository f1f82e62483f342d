#include <statuscast/status/StatusPayload.hpp>

#include <utility>

namespace SC {

auto status_state_name(StatusState state) -> std::string_view {
    switch (state) {
    case StatusState::Running:
        return "running";
    case StatusState::Restarting:
        return "restarting";
    case StatusState::Error:
        return "error";
    }
    return "error";
}

StatusPayload::StatusPayload(StatusState state, std::optional<std::string> message)
    : state_{state}
    , message_{std::move(message)} {}

auto StatusPayload::Running() -> StatusPayload {
    return StatusPayload{StatusState::Running, std::nullopt};
}

auto StatusPayload::Restarting() -> StatusPayload {
    return StatusPayload{StatusState::Restarting, std::nullopt};
}

auto StatusPayload::Failure(std::string message) -> StatusPayload {
    if (message.empty()) {
        message = "unknown error";
    }
    return StatusPayload{StatusState::Error, std::move(message)};
}

} // namespace SC
