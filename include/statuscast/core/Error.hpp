#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace SC {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotConfigured,
        NotRestartable,
        RestartInProgress,
        RestartTimeout,
        ExternalOrchestrationFailure,
        InvalidConfiguration,
        MalformedInput,
        IoFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotConfigured:
        return "not_configured";
    case Error::Code::NotRestartable:
        return "not_restartable";
    case Error::Code::RestartInProgress:
        return "restart_in_progress";
    case Error::Code::RestartTimeout:
        return "restart_timeout";
    case Error::Code::ExternalOrchestrationFailure:
        return "external_orchestration_failure";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::IoFailure:
        return "io_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Message text without the code label, used where the diagnostic is shown to observers.
[[nodiscard]] inline auto errorMessageOr(Error const& error, std::string_view fallback) -> std::string {
    if (error.message && !error.message->empty()) {
        return *error.message;
    }
    return std::string{fallback};
}

} // namespace SC
