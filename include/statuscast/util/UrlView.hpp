#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace SC {

struct UrlView {
    std::string scheme;
    std::string host;
    std::string path;
    int         port{0};
    bool        tls{false};
};

// Accepts http:// and https:// URLs with an optional port and path.
auto parse_url(std::string_view url) -> std::optional<UrlView>;

} // namespace SC
