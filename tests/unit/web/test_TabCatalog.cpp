#include <doctest/doctest.h>

#include <statuscast/web/TabCatalog.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace SC;

namespace {

constexpr char const* kTwoTabs = R"({
  "tabs": [
    {"text": " Grafana ", "iconUrl": "/icons/grafana.svg", "iframeUrl": "https://grafana.internal"},
    {"text": "API", "iconUrl": "/icons/api.svg", "iframeUrl": "https://api.internal/docs",
     "tabColor": "#ff8800", "k8s": {"namespace": "prod", "deployment": "api-server"}}
  ]
})";

auto error_message(Expected<TabCatalog> const& result) -> std::string {
    REQUIRE_FALSE(result.has_value());
    return result.error().message.value_or("");
}

} // namespace

TEST_SUITE("web.tab_catalog") {

TEST_CASE("parses tabs and trims strings") {
    auto catalog = TabCatalog::FromJsonText(kTwoTabs);
    REQUIRE(catalog.has_value());
    REQUIRE(catalog->size() == 2);

    auto grafana = catalog->get_tab(0);
    REQUIRE(grafana.has_value());
    CHECK(grafana->text == "Grafana");
    CHECK_FALSE(grafana->restartable());
    CHECK_FALSE(grafana->tab_color.has_value());

    auto api = catalog->get_tab(1);
    REQUIRE(api.has_value());
    CHECK(api->restartable());
    CHECK(api->tab_color == std::optional<std::string>{"#ff8800"});
    CHECK(api->k8s == std::optional<DeploymentRef>{DeploymentRef{"prod", "api-server"}});
}

TEST_CASE("channel keys follow the deployment for restartable tabs") {
    auto catalog = TabCatalog::FromJsonText(kTwoTabs);
    REQUIRE(catalog.has_value());

    auto static_key = catalog->channel_key(0);
    REQUIRE(static_key.has_value());
    CHECK(*static_key == ResourceKey{"tabs", "0"});

    auto deployment_key = catalog->channel_key(1);
    REQUIRE(deployment_key.has_value());
    CHECK(*deployment_key == ResourceKey{"prod", "api-server"});

    auto missing = catalog->channel_key(9);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotConfigured);
}

TEST_CASE("restart eligibility") {
    auto catalog = TabCatalog::FromJsonText(kTwoTabs);
    REQUIRE(catalog.has_value());

    CHECK(catalog->require_restartable(1).has_value());

    auto static_tab = catalog->require_restartable(0);
    REQUIRE_FALSE(static_tab.has_value());
    CHECK(static_tab.error().code == Error::Code::NotRestartable);

    auto out_of_range = catalog->require_restartable(2);
    REQUIRE_FALSE(out_of_range.has_value());
    CHECK(out_of_range.error().code == Error::Code::NotConfigured);
    CHECK(out_of_range.error().message == std::optional<std::string>{"tab index 2 is out of range"});
}

TEST_CASE("config response lists tabs in order with public fields only") {
    auto catalog = TabCatalog::FromJsonText(kTwoTabs);
    REQUIRE(catalog.has_value());

    CHECK(catalog->to_response().dump()
          == R"({"tabs":[{"text":"Grafana","iconUrl":"/icons/grafana.svg","iframeUrl":"https://grafana.internal","restartable":false,"tabColor":null},)"
             R"({"text":"API","iconUrl":"/icons/api.svg","iframeUrl":"https://api.internal/docs","restartable":true,"tabColor":"#ff8800"}]})");
}

TEST_CASE("invalid documents name the offending field") {
    CHECK(error_message(TabCatalog::FromJsonText(R"({"tabs": []})")) == "at least one tab must be defined");
    CHECK(error_message(TabCatalog::FromJsonText(R"({"tabs": {}})")) == "tabs must be a list");
    CHECK(error_message(TabCatalog::FromJsonText(R"({"tabs": [{"text": "", "iconUrl": "a", "iframeUrl": "b"}]})"))
          == "tabs[0].text must not be empty");
    CHECK(error_message(TabCatalog::FromJsonText(
              R"({"tabs": [{"text": "a", "iconUrl": "a", "iframeUrl": "b"},
                           {"text": "b", "iconUrl": "a", "iframeUrl": "b", "k8s": {"namespace": " ", "deployment": "x"}}]})"))
          == "tabs[1].k8s.namespace must not be empty");
    CHECK(error_message(TabCatalog::FromJsonText(
              R"({"tabs": [{"text": "a", "iconUrl": "a", "iframeUrl": "b", "k8s": {"namespace": "prod"}}]})"))
          == "tabs[0].k8s.deployment is required");
    CHECK(error_message(TabCatalog::FromJsonText(
              R"({"tabs": [{"text": "a", "iconUrl": "a", "iframeUrl": "b", "k8s": {"namespace": "Prod", "deployment": "x"}}]})"))
          == "tabs[0].k8s.namespace is not a valid Kubernetes name");

    auto invalid = TabCatalog::FromJsonText(R"({"tabs": []})");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::InvalidConfiguration);
}

TEST_CASE("malformed JSON is rejected") {
    auto result = TabCatalog::FromJsonText("{\"tabs\": [");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::MalformedInput);
}

TEST_CASE("loading from disk") {
    auto const path = std::filesystem::temp_directory_path()
                      / ("statuscast-tabs-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())
                         + ".json");

    SUBCASE("missing file is not configured") {
        auto result = TabCatalog::LoadFile(path);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::NotConfigured);
    }

    SUBCASE("valid file loads") {
        {
            std::ofstream output(path);
            output << kTwoTabs;
        }
        auto result = TabCatalog::LoadFile(path);
        std::filesystem::remove(path);
        REQUIRE(result.has_value());
        CHECK(result->size() == 2);
    }

    SUBCASE("errors mention the path") {
        {
            std::ofstream output(path);
            output << R"({"tabs": []})";
        }
        auto result = TabCatalog::LoadFile(path);
        std::filesystem::remove(path);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message->find("(path=" + path.string() + ")") != std::string::npos);
    }
}

TEST_CASE("kubernetes names") {
    CHECK(is_kubernetes_name("api-server"));
    CHECK(is_kubernetes_name("kube-system"));
    CHECK_FALSE(is_kubernetes_name("API"));
    CHECK_FALSE(is_kubernetes_name("-api"));
    CHECK_FALSE(is_kubernetes_name("api_server"));
    CHECK_FALSE(is_kubernetes_name(""));
}

}
