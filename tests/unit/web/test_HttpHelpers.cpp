#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <doctest/doctest.h>

#include <statuscast/web/routing/HttpHelpers.hpp>

#include <regex>
#include <string>

using namespace SC;

TEST_SUITE("web.http_helpers") {

TEST_CASE("error codes map onto HTTP statuses") {
    CHECK(http_status_for(Error::Code::NotConfigured) == 404);
    CHECK(http_status_for(Error::Code::NotRestartable) == 400);
    CHECK(http_status_for(Error::Code::MalformedInput) == 400);
    CHECK(http_status_for(Error::Code::RestartInProgress) == 409);
    CHECK(http_status_for(Error::Code::RestartTimeout) == 504);
    CHECK(http_status_for(Error::Code::ExternalOrchestrationFailure) == 502);
    CHECK(http_status_for(Error::Code::IoFailure) == 500);
}

TEST_CASE("error bodies carry code and message") {
    httplib::Response res;
    respond_error(res, Error{Error::Code::NotRestartable, "tab index 0 is not restartable"});
    CHECK(res.status == 400);
    CHECK(res.body == R"({"error":"not_restartable","message":"tab index 0 is not restartable"})");
    CHECK(res.get_header_value("Cache-Control") == "no-store");

    httplib::Response bare;
    respond_error(bare, Error{Error::Code::RestartInProgress, {}});
    CHECK(bare.status == 409);
    CHECK(bare.body == R"({"error":"restart_in_progress","message":""})");
}

TEST_CASE("tab index comes from the first route capture") {
    static std::regex const route{R"(/api/restart/(\d+))"};

    httplib::Request req;
    std::string      path = "/api/restart/12";
    REQUIRE(std::regex_match(path, req.matches, route));
    CHECK(parse_tab_index(req) == std::optional<std::size_t>{12});

    httplib::Request huge;
    std::string      overflow = "/api/restart/999999999999999999999999";
    REQUIRE(std::regex_match(overflow, huge.matches, route));
    CHECK_FALSE(parse_tab_index(huge).has_value());

    httplib::Request unmatched;
    CHECK_FALSE(parse_tab_index(unmatched).has_value());
}

}
