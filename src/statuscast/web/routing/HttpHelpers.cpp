#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include <httplib.h>

#include <statuscast/web/routing/HttpHelpers.hpp>

#include <charconv>
#include <string>

namespace SC {

void write_json_response(httplib::Response&            res,
                         nlohmann::ordered_json const& payload,
                         int                           status,
                         bool                          no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void write_error_response(httplib::Response& res, std::string_view code, std::string_view message, int status) {
    write_json_response(res,
                        nlohmann::ordered_json{{"error", code},
                                               {"message", message}},
                        status,
                        true);
}

auto http_status_for(Error::Code code) -> int {
    switch (code) {
    case Error::Code::NotConfigured:
        return 404;
    case Error::Code::NotRestartable:
    case Error::Code::MalformedInput:
        return 400;
    case Error::Code::RestartInProgress:
        return 409;
    case Error::Code::RestartTimeout:
        return 504;
    case Error::Code::ExternalOrchestrationFailure:
        return 502;
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
    case Error::Code::InvalidConfiguration:
    case Error::Code::IoFailure:
        return 500;
    }
    return 500;
}

void respond_error(httplib::Response& res, Error const& error) {
    write_error_response(res,
                         errorCodeToString(error.code),
                         error.message.value_or(std::string{errorCodeToString(error.code)}),
                         http_status_for(error.code));
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_error_response(res, "bad_request", message, 400);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_error_response(res, "internal", message, 500);
}

auto parse_tab_index(httplib::Request const& req) -> std::optional<std::size_t> {
    if (req.matches.size() < 2) {
        return std::nullopt;
    }
    std::string const text = req.matches[1];
    std::size_t       value = 0;
    auto              result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace SC
