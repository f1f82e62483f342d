#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace SC {

enum class StatusState {
    Running,
    Restarting,
    Error,
};

[[nodiscard]] auto status_state_name(StatusState state) -> std::string_view;

/**
 * Immutable status value published on a broadcast channel.
 *
 * Only the Error state carries a message. Instances are built through the
 * named factories so an Error without a diagnostic cannot be constructed.
 */
class StatusPayload {
public:
    static auto Running() -> StatusPayload;
    static auto Restarting() -> StatusPayload;
    static auto Failure(std::string message) -> StatusPayload;

    [[nodiscard]] auto state() const -> StatusState { return state_; }
    [[nodiscard]] auto message() const -> std::optional<std::string> const& { return message_; }

    auto operator==(StatusPayload const&) const -> bool = default;

private:
    StatusPayload(StatusState state, std::optional<std::string> message);

    StatusState                state_;
    std::optional<std::string> message_;
};

} // namespace SC
