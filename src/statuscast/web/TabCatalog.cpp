#include <statuscast/web/TabCatalog.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace SC {

namespace {

using json = nlohmann::json;

auto trim(std::string_view value) -> std::string {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return std::string{value};
}

auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

auto required_string(json const& object, char const* name, std::string const& where) -> Expected<std::string> {
    auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return std::unexpected(invalid(where + "." + name + " is required"));
    }
    if (!it->is_string()) {
        return std::unexpected(invalid(where + "." + name + " must be a string"));
    }
    auto value = trim(it->get_ref<std::string const&>());
    if (value.empty()) {
        return std::unexpected(invalid(where + "." + name + " must not be empty"));
    }
    return value;
}

auto optional_string(json const& object, char const* name, std::string const& where)
    -> Expected<std::optional<std::string>> {
    auto it = object.find(name);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    auto value = required_string(object, name, where);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::optional<std::string>{std::move(*value)};
}

auto parse_k8s(json const& object, std::string const& where) -> Expected<std::optional<DeploymentRef>> {
    auto it = object.find("k8s");
    if (it == object.end() || it->is_null()) {
        return std::optional<DeploymentRef>{};
    }
    auto const k8s_where = where + ".k8s";
    if (!it->is_object()) {
        return std::unexpected(invalid(k8s_where + " must be an object"));
    }
    auto namespace_name = required_string(*it, "namespace", k8s_where);
    if (!namespace_name) {
        return std::unexpected(namespace_name.error());
    }
    auto deployment = required_string(*it, "deployment", k8s_where);
    if (!deployment) {
        return std::unexpected(deployment.error());
    }
    if (!is_kubernetes_name(*namespace_name)) {
        return std::unexpected(invalid(k8s_where + ".namespace is not a valid Kubernetes name"));
    }
    if (!is_kubernetes_name(*deployment)) {
        return std::unexpected(invalid(k8s_where + ".deployment is not a valid Kubernetes name"));
    }
    return std::optional<DeploymentRef>{DeploymentRef{std::move(*namespace_name), std::move(*deployment)}};
}

auto parse_tab(json const& entry, std::size_t index) -> Expected<TabConfig> {
    auto const where = "tabs[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        return std::unexpected(invalid(where + " must be an object"));
    }
    TabConfig tab;
    auto      text = required_string(entry, "text", where);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto icon_url = required_string(entry, "iconUrl", where);
    if (!icon_url) {
        return std::unexpected(icon_url.error());
    }
    auto iframe_url = required_string(entry, "iframeUrl", where);
    if (!iframe_url) {
        return std::unexpected(iframe_url.error());
    }
    auto tab_color = optional_string(entry, "tabColor", where);
    if (!tab_color) {
        return std::unexpected(tab_color.error());
    }
    auto k8s = parse_k8s(entry, where);
    if (!k8s) {
        return std::unexpected(k8s.error());
    }
    tab.text       = std::move(*text);
    tab.icon_url   = std::move(*icon_url);
    tab.iframe_url = std::move(*iframe_url);
    tab.tab_color  = std::move(*tab_color);
    tab.k8s        = std::move(*k8s);
    return tab;
}

} // namespace

auto is_kubernetes_name(std::string_view value) -> bool {
    if (value.empty() || value.size() > 253) {
        return false;
    }
    if (value.front() == '-' || value.front() == '.' || value.back() == '-' || value.back() == '.') {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::islower(ch) != 0 || std::isdigit(ch) != 0 || ch == '-' || ch == '.';
    });
}

auto channel_key_for(TabConfig const& tab, std::size_t index) -> ResourceKey {
    if (tab.k8s) {
        return ResourceKey{tab.k8s->namespace_name, tab.k8s->deployment};
    }
    return ResourceKey{std::string{TabCatalog::kStaticScope}, std::to_string(index)};
}

auto TabCatalog::FromJson(json const& document) -> Expected<TabCatalog> {
    if (!document.is_object()) {
        return std::unexpected(invalid("configuration root must be an object"));
    }
    auto it = document.find("tabs");
    if (it == document.end() || !it->is_array()) {
        return std::unexpected(invalid("tabs must be a list"));
    }
    if (it->empty()) {
        return std::unexpected(invalid("at least one tab must be defined"));
    }
    std::vector<TabConfig> tabs;
    tabs.reserve(it->size());
    for (std::size_t index = 0; index < it->size(); ++index) {
        auto tab = parse_tab((*it)[index], index);
        if (!tab) {
            return std::unexpected(tab.error());
        }
        tabs.push_back(std::move(*tab));
    }
    return TabCatalog{std::move(tabs)};
}

auto TabCatalog::FromJsonText(std::string_view text) -> Expected<TabCatalog> {
    auto document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "tab configuration is not valid JSON"});
    }
    return FromJson(document);
}

auto TabCatalog::LoadFile(std::filesystem::path const& path) -> Expected<TabCatalog> {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotConfigured, "unable to read tab configuration " + path.string()});
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto catalog = FromJsonText(buffer.str());
    if (!catalog) {
        auto error = catalog.error();
        error.message = errorMessageOr(error, "invalid configuration") + " (path=" + path.string() + ")";
        return std::unexpected(std::move(error));
    }
    return catalog;
}

auto TabCatalog::get_tab(std::size_t index) const -> Expected<TabConfig> {
    if (index >= tabs_.size()) {
        return std::unexpected(Error{Error::Code::NotConfigured, "tab index " + std::to_string(index) + " is out of range"});
    }
    return tabs_[index];
}

auto TabCatalog::require_restartable(std::size_t index) const -> Expected<TabConfig> {
    auto tab = get_tab(index);
    if (!tab) {
        return tab;
    }
    if (!tab->restartable()) {
        return std::unexpected(
            Error{Error::Code::NotRestartable, "tab index " + std::to_string(index) + " is not restartable"});
    }
    return tab;
}

auto TabCatalog::channel_key(std::size_t index) const -> Expected<ResourceKey> {
    if (index >= tabs_.size()) {
        return std::unexpected(Error{Error::Code::NotConfigured, "tab index " + std::to_string(index) + " is out of range"});
    }
    return channel_key_for(tabs_[index], index);
}

auto TabCatalog::to_response() const -> nlohmann::ordered_json {
    auto tabs = nlohmann::ordered_json::array();
    for (auto const& tab : tabs_) {
        nlohmann::ordered_json entry;
        entry["text"]        = tab.text;
        entry["iconUrl"]     = tab.icon_url;
        entry["iframeUrl"]   = tab.iframe_url;
        entry["restartable"] = tab.restartable();
        entry["tabColor"]    = tab.tab_color ? nlohmann::ordered_json(*tab.tab_color) : nlohmann::ordered_json(nullptr);
        tabs.push_back(std::move(entry));
    }
    return nlohmann::ordered_json{{"tabs", std::move(tabs)}};
}

} // namespace SC
