#include <statuscast/restart/DeploymentReadiness.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace SC {

namespace {

using json = nlohmann::json;

auto field(json const& object, char const* name) -> json const* {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

auto int_field(json const& object, char const* name) -> std::optional<std::int64_t> {
    auto const* value = field(object, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->get<std::int64_t>();
    }
    if (value->is_number_float()) {
        auto const number = value->get<double>();
        // 2^63 is exactly representable; anything at or past it does not fit.
        constexpr double kLimit = 9223372036854775808.0;
        if (!std::isfinite(number) || std::trunc(number) != number || number < -kLimit || number >= kLimit) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(number);
    }
    if (value->is_string()) {
        auto const& text   = value->get_ref<std::string const&>();
        std::int64_t parsed = 0;
        auto result = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (result.ec == std::errc{} && result.ptr == text.data() + text.size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

auto string_field(json const& object, char const* name) -> std::string {
    auto const* value = field(object, name);
    if (value == nullptr) {
        return {};
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    if (value->is_boolean()) {
        return value->get<bool>() ? "true" : "false";
    }
    return value->dump();
}

auto lowercase(std::string text) -> std::string {
    std::ranges::transform(text, text.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

auto conditions_of(json const& status) -> json const* {
    auto const* conditions = field(status, "conditions");
    if (conditions == nullptr || !conditions->is_array()) {
        return nullptr;
    }
    return conditions;
}

} // namespace

auto detect_rollout_failure(json const& deployment, std::int64_t target_generation) -> std::optional<std::string> {
    auto const* status = field(deployment, "status");
    if (status == nullptr) {
        return std::nullopt;
    }
    auto const* conditions = conditions_of(*status);
    if (conditions == nullptr) {
        return std::nullopt;
    }

    for (auto const& condition : *conditions) {
        auto const type = string_field(condition, "type");
        if (type != "Progressing") {
            continue;
        }
        auto const condition_generation = int_field(condition, "observedGeneration");
        if (condition_generation && *condition_generation < target_generation) {
            continue;
        }
        if (lowercase(string_field(condition, "status")) != "false") {
            continue;
        }
        auto const reason = string_field(condition, "reason");
        auto       detail = string_field(condition, "message");
        if (detail.empty()) {
            if (reason == "ProgressDeadlineExceeded") {
                detail = "progress deadline exceeded";
            } else if (!reason.empty()) {
                detail = reason;
            } else {
                detail = "rollout halted";
            }
        }
        return "deployment rollout failed: " + detail;
    }
    return std::nullopt;
}

auto deployment_ready(json const& deployment, std::int64_t target_generation) -> bool {
    auto const* status = field(deployment, "status");
    if (status == nullptr) {
        return false;
    }

    auto const observed_generation = int_field(*status, "observedGeneration");
    if (!observed_generation || *observed_generation < target_generation) {
        return false;
    }

    std::optional<std::int64_t> desired;
    if (auto const* spec = field(deployment, "spec")) {
        desired = int_field(*spec, "replicas");
    }
    if (!desired) {
        desired = int_field(*status, "replicas");
    }

    auto const ready     = int_field(*status, "readyReplicas");
    auto const available = int_field(*status, "availableReplicas");
    auto const updated   = int_field(*status, "updatedReplicas");

    if (!desired) {
        if (!ready && !available) {
            return false;
        }
    } else {
        for (auto const& value : {ready, available, updated}) {
            if (!value || *value < *desired) {
                return false;
            }
        }
    }

    if (auto const* metadata = field(deployment, "metadata")) {
        auto const generation = int_field(*metadata, "generation");
        if (generation && *generation > *observed_generation) {
            return false;
        }
    }

    if (auto const* conditions = conditions_of(*status)) {
        for (auto const& condition : *conditions) {
            if (string_field(condition, "type") != "Available") {
                continue;
            }
            if (lowercase(string_field(condition, "status")) != "true") {
                return false;
            }
            auto const condition_generation = int_field(condition, "observedGeneration");
            if (!condition_generation || *condition_generation >= target_generation) {
                return true;
            }
        }
    }
    return (ready && *ready > 0) || (available && *available > 0);
}

auto evaluate_rollout(json const& deployment, std::int64_t target_generation) -> RolloutSignal {
    if (auto failure = detect_rollout_failure(deployment, target_generation)) {
        return RolloutSignal{RolloutSignalKind::Failed, std::move(*failure)};
    }
    if (deployment_ready(deployment, target_generation)) {
        return RolloutSignal{RolloutSignalKind::Ready, {}};
    }
    return RolloutSignal{RolloutSignalKind::NotReady, {}};
}

} // namespace SC
