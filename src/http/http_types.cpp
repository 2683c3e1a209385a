#include <rangeio/http/http_client.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rangeio::http {

namespace {

std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::int64_t> parseInt64(std::string_view s) {
    s = trim(s);
    if (s.empty())
        return std::nullopt;
    std::int64_t value{0};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value < 0)
        return std::nullopt;
    return value;
}

} // namespace

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> HeaderMap::get(std::string_view name) const {
    for (const auto& h : _headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

bool HeaderMap::contains(std::string_view name) const {
    return std::any_of(_headers.begin(), _headers.end(),
                       [&](const Header& h) { return iequals(h.name, name); });
}

void HeaderMap::set(std::string name, std::string value) {
    remove(name);
    _headers.push_back(Header{std::move(name), std::move(value)});
}

void HeaderMap::add(std::string name, std::string value) {
    _headers.push_back(Header{std::move(name), std::move(value)});
}

void HeaderMap::remove(std::string_view name) {
    _headers.erase(std::remove_if(_headers.begin(), _headers.end(),
                                  [&](const Header& h) { return iequals(h.name, name); }),
                   _headers.end());
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trim(value);
    constexpr std::string_view kUnit = "bytes";
    if (value.size() <= kUnit.size() || !iequals(value.substr(0, kUnit.size()), kUnit))
        return std::nullopt;
    value = trim(value.substr(kUnit.size()));

    const auto slash = value.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    const auto span = value.substr(0, slash);
    const auto totalPart = trim(value.substr(slash + 1));

    const auto dash = span.find('-');
    if (dash == std::string_view::npos)
        return std::nullopt; // "bytes */total" carries no satisfiable range

    auto first = parseInt64(span.substr(0, dash));
    auto last = parseInt64(span.substr(dash + 1));
    if (!first || !last || *last < *first)
        return std::nullopt;

    ContentRange out;
    out.first = *first;
    out.last = *last;
    if (totalPart != "*") {
        auto total = parseInt64(totalPart);
        if (!total || *total <= *last)
            return std::nullopt;
        out.total = *total;
    }
    return out;
}

std::string HttpResponse::statusLine() const {
    std::string line = std::to_string(statusCode);
    if (!reason.empty()) {
        line.push_back(' ');
        line.append(reason);
    }
    return line;
}

} // namespace rangeio::http
