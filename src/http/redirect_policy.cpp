#include <rangeio/http/http_client.hpp>

#include <array>

namespace rangeio::http {

namespace {

struct UrlParts {
    std::string_view scheme;
    std::string_view authority;
};

std::optional<UrlParts> splitUrl(std::string_view url) {
    const auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return std::nullopt;
    UrlParts parts;
    parts.scheme = url.substr(0, sep);
    auto rest = url.substr(sep + 3);
    const auto end = rest.find_first_of("/?#");
    parts.authority = end == std::string_view::npos ? rest : rest.substr(0, end);
    // userinfo is not part of the host
    if (auto at = parts.authority.rfind('@'); at != std::string_view::npos)
        parts.authority = parts.authority.substr(at + 1);
    return parts;
}

constexpr std::array<std::string_view, 3> kCredentialHeaders = {"Authorization", "Cookie",
                                                                  "Proxy-Authorization"};

} // namespace

Expected<HeaderMap> RedirectPolicy::nextHop(const HttpRequest& original, int hop,
                                            std::string_view fromUrl,
                                            std::string_view toUrl) const {
    if (!follow) {
        return Error{ErrorCode::PolicyViolation, "redirects are disabled"};
    }
    if (!iequals(original.method, "GET")) {
        return Error{ErrorCode::PolicyViolation,
                     "refusing to follow redirect for " + original.method + " request to " +
                         std::string(toUrl)};
    }
    if (hop > maxRedirects) {
        return Error{ErrorCode::PolicyViolation,
                     "stopped after " + std::to_string(maxRedirects) + " redirects"};
    }

    auto target = splitUrl(toUrl);
    if (!target || !(iequals(target->scheme, "http") || iequals(target->scheme, "https"))) {
        return Error{ErrorCode::PolicyViolation,
                     "refusing to follow redirect to unsupported location " + std::string(toUrl)};
    }

    HeaderMap headers = original.headers;
    if (preserveHeaders)
        return headers;

    auto source = splitUrl(fromUrl);
    const bool sameHost = source && iequals(source->authority, target->authority);
    if (!sameHost) {
        for (auto name : kCredentialHeaders)
            headers.remove(name);
    }
    return headers;
}

} // namespace rangeio::http
