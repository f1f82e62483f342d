#include <statuscast/util/UrlView.hpp>

#include <charconv>

namespace SC {

auto parse_url(std::string_view url) -> std::optional<UrlView> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    bool tls    = false;
    if (scheme == "https") {
        tls = true;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    auto             remainder = url.substr(scheme_end + 3);
    auto             slash     = remainder.find('/');
    std::string_view authority = remainder.substr(0, slash);
    std::string      path      = slash == std::string_view::npos ? std::string{} : std::string{remainder.substr(slash)};
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    std::string host;
    int         port  = tls ? 443 : 80;
    auto        colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']', colon) == std::string_view::npos) {
        host           = std::string{authority.substr(0, colon)};
        auto port_view = authority.substr(colon + 1);
        int  parsed    = 0;
        auto result    = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed);
        if (port_view.empty() || result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size()
            || parsed <= 0 || parsed > 65535) {
            return std::nullopt;
        }
        port = parsed;
    } else {
        host = std::string{authority};
    }
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        return std::nullopt;
    }

    return UrlView{std::string{scheme}, std::move(host), std::move(path), port, tls};
}

} // namespace SC
