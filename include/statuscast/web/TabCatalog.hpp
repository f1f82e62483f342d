#pragma once

#include <statuscast/core/Error.hpp>
#include <statuscast/restart/OrchestrationClient.hpp>
#include <statuscast/status/ResourceKey.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace SC {

struct TabConfig {
    std::string                  text;
    std::string                  icon_url;
    std::string                  iframe_url;
    std::optional<std::string>   tab_color;
    std::optional<DeploymentRef> k8s;

    [[nodiscard]] auto restartable() const -> bool { return k8s.has_value(); }
};

/**
 * Immutable, validated list of dashboard tabs.
 *
 * A restartable tab publishes on the (namespace, deployment) channel so that
 * several tabs pointing at one deployment share status. Other tabs get a
 * channel of their own that only ever reports running.
 */
class TabCatalog {
public:
    static constexpr std::string_view kStaticScope = "tabs";

    static auto FromJson(nlohmann::json const& document) -> Expected<TabCatalog>;
    static auto FromJsonText(std::string_view text) -> Expected<TabCatalog>;
    static auto LoadFile(std::filesystem::path const& path) -> Expected<TabCatalog>;

    [[nodiscard]] auto size() const -> std::size_t { return tabs_.size(); }
    [[nodiscard]] auto tabs() const -> std::vector<TabConfig> const& { return tabs_; }

    auto get_tab(std::size_t index) const -> Expected<TabConfig>;
    auto require_restartable(std::size_t index) const -> Expected<TabConfig>;
    auto channel_key(std::size_t index) const -> Expected<ResourceKey>;

    // Public /api/config payload.
    [[nodiscard]] auto to_response() const -> nlohmann::ordered_json;

private:
    explicit TabCatalog(std::vector<TabConfig> tabs)
        : tabs_{std::move(tabs)} {}

    std::vector<TabConfig> tabs_;
};

[[nodiscard]] auto channel_key_for(TabConfig const& tab, std::size_t index) -> ResourceKey;

// Kubernetes object names: lowercase alphanumerics, '-' and '.'.
[[nodiscard]] auto is_kubernetes_name(std::string_view value) -> bool;

} // namespace SC
