/*
 * curl_transport.cpp
 *
 * Notes
 * - IHttpTransport on top of the libcurl multi API, driven on the calling thread.
 * - send() pumps the transfer until the response headers are complete; the body is then
 *   pulled on demand by CurlExchange::read(), so a caller sees exactly the bytes it asked for.
 * - Redirects are not followed by curl. Each 3xx hop goes through RedirectPolicy::nextHop().
 * - No Accept-Encoding is sent: byte offsets must refer to the stored representation.
 *
 * Build
 * - Linked via CURL::libcurl, logs through spdlog.
 */

#include <rangeio/core/logging.h>
#include <rangeio/http/http_client.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <mutex>
#include <string_view>

namespace rangeio::http {

namespace {

constexpr int kPollIntervalMs = 100;
// Received but unread body bytes held before the transfer is paused
constexpr std::size_t kMaxPendingBytes = 1024 * 1024;

// Local helper: trim whitespace
std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where, const char* detail) {
    Error err;
    err.message = std::string(where) + ": " +
                  ((detail != nullptr && detail[0] != '\0') ? detail : curl_easy_strerror(code));
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<std::int64_t> declaredLength(const HeaderMap& headers) {
    if (auto te = headers.get("Transfer-Encoding")) {
        std::string lower = *te;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.find("chunked") != std::string::npos)
            return std::nullopt;
    }
    auto raw = headers.get("Content-Length");
    if (!raw)
        return std::nullopt;
    std::int64_t value{0};
    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last || value < 0)
        return std::nullopt;
    return value;
}

/**
 * One request/response exchange: a curl easy handle on its own multi handle.
 * Owns every curl resource and doubles as the response body.
 */
class CurlExchange final : public IBodyStream {
public:
    CurlExchange() = default;
    ~CurlExchange() override { close(); }

    CurlExchange(const CurlExchange&) = delete;
    CurlExchange& operator=(const CurlExchange&) = delete;

    Expected<void> start(const std::string& method, const std::string& url,
                         const HeaderMap& headers, const ClientConfig& config) {
        _multi = curl_multi_init();
        _easy = curl_easy_init();
        if (!_multi || !_easy) {
            return Error{ErrorCode::Unknown, "curl handle initialisation failed"};
        }

        for (const auto& h : headers) {
            std::string line = h.name;
            line.append(": ");
            line.append(h.value);
            _headerList = curl_slist_append(_headerList, line.c_str());
        }

        curl_easy_setopt(_easy, CURLOPT_URL, url.c_str());
        if (method == "GET") {
            curl_easy_setopt(_easy, CURLOPT_HTTPGET, 1L);
        } else if (method == "HEAD") {
            curl_easy_setopt(_easy, CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(_easy, CURLOPT_CUSTOMREQUEST, method.c_str());
        }
        curl_easy_setopt(_easy, CURLOPT_HTTPHEADER, _headerList);
        curl_easy_setopt(_easy, CURLOPT_HEADERFUNCTION, &CurlExchange::headerCallback);
        curl_easy_setopt(_easy, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(_easy, CURLOPT_WRITEFUNCTION, &CurlExchange::writeCallback);
        curl_easy_setopt(_easy, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(_easy, CURLOPT_ERRORBUFFER, _errorBuffer);
        curl_easy_setopt(_easy, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(_easy, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
        curl_easy_setopt(_easy, CURLOPT_NOSIGNAL, 1L);
        configureCommon(config);

        CURLMcode mc = curl_multi_add_handle(_multi, _easy);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::Unknown,
                         std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)};
        }
        _attached = true;
        return {};
    }

    /// Drives the transfer until the response headers (final status) are complete.
    Expected<void> awaitHeaders() {
        while (!_headersComplete && !_done) {
            auto r = pump();
            if (!r.ok())
                return r;
        }
        if (!_headersComplete) {
            if (_result != CURLE_OK)
                return makeCurlError(_result, "send", _errorBuffer);
            if (_status == 0)
                return Error{ErrorCode::NetworkError, "send: no response headers received"};
        }
        return {};
    }

    Expected<std::size_t> read(MutableByteSpan buffer) override {
        if (!_easy) {
            return Error{ErrorCode::IoError, "read on a released response body"};
        }
        if (buffer.empty())
            return std::size_t{0};

        while (available() == 0) {
            if (_paused) {
                _paused = false;
                CURLcode rc = curl_easy_pause(_easy, CURLPAUSE_CONT);
                if (rc != CURLE_OK)
                    return makeCurlError(rc, "read", _errorBuffer);
                continue;
            }
            if (_done) {
                if (_result != CURLE_OK)
                    return makeCurlError(_result, "read", _errorBuffer);
                return std::size_t{0};
            }
            auto r = pump();
            if (!r.ok())
                return r.error();
        }

        const std::size_t n = std::min(buffer.size(), available());
        std::memcpy(buffer.data(), _pending.data() + _offset, n);
        _offset += n;
        if (_offset == _pending.size()) {
            _pending.clear();
            _offset = 0;
        }
        return n;
    }

    void close() noexcept override {
        if (_multi && _easy && _attached)
            curl_multi_remove_handle(_multi, _easy);
        _attached = false;
        if (_easy) {
            curl_easy_cleanup(_easy);
            _easy = nullptr;
        }
        if (_multi) {
            curl_multi_cleanup(_multi);
            _multi = nullptr;
        }
        if (_headerList) {
            curl_slist_free_all(_headerList);
            _headerList = nullptr;
        }
        _pending.clear();
        _offset = 0;
    }

    [[nodiscard]] int status() const noexcept { return _status; }
    [[nodiscard]] const std::string& reason() const noexcept { return _reason; }
    [[nodiscard]] const HeaderMap& headers() const noexcept { return _headers; }

    [[nodiscard]] std::optional<std::string> redirectUrl() const {
        char* location = nullptr;
        if (curl_easy_getinfo(_easy, CURLINFO_REDIRECT_URL, &location) != CURLE_OK ||
            location == nullptr) {
            return std::nullopt;
        }
        return std::string(location);
    }

private:
    void configureCommon(const ClientConfig& config) {
        // Timeouts: connect, stall detection, optional overall cap
        curl_easy_setopt(_easy, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config.connectTimeout.count()));
        if (config.totalTimeout.count() > 0) {
            curl_easy_setopt(_easy, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(config.totalTimeout.count()));
        }
        if (config.idleTimeout.count() > 0) {
            const long idleSeconds = std::max<long>(1, config.idleTimeout.count() / 1000);
            curl_easy_setopt(_easy, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(_easy, CURLOPT_LOW_SPEED_TIME, idleSeconds);
        }

        // TLS
        curl_easy_setopt(_easy, CURLOPT_SSL_VERIFYPEER, config.tls.insecure ? 0L : 1L);
        curl_easy_setopt(_easy, CURLOPT_SSL_VERIFYHOST, config.tls.insecure ? 0L : 2L);
        if (!config.tls.caPath.empty()) {
            curl_easy_setopt(_easy, CURLOPT_CAINFO, config.tls.caPath.c_str());
        }

        // Proxy
        if (config.proxy && !config.proxy->empty()) {
            curl_easy_setopt(_easy, CURLOPT_PROXY, config.proxy->c_str());
        }

        if (!config.userAgent.empty()) {
            curl_easy_setopt(_easy, CURLOPT_USERAGENT, config.userAgent.c_str());
        }

        // Robustness
        curl_easy_setopt(_easy, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(_easy, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(_easy, CURLOPT_TCP_KEEPINTVL, 15L);
        curl_easy_setopt(_easy, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    }

    [[nodiscard]] std::size_t available() const noexcept { return _pending.size() - _offset; }

    // One perform step; waits on the sockets when the step produced nothing new.
    Expected<void> pump() {
        const auto pendingBefore = _pending.size();
        const bool headersBefore = _headersComplete;

        int running = 0;
        CURLMcode mc = curl_multi_perform(_multi, &running);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::NetworkError,
                         std::string("curl_multi_perform: ") + curl_multi_strerror(mc)};
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(_multi, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == _easy) {
                _done = true;
                _result = msg->data.result;
            }
        }

        const bool progressed =
            _done || _pending.size() != pendingBefore || _headersComplete != headersBefore;
        if (!progressed) {
            mc = curl_multi_poll(_multi, nullptr, 0, kPollIntervalMs, nullptr);
            if (mc != CURLM_OK) {
                return Error{ErrorCode::NetworkError,
                             std::string("curl_multi_poll: ") + curl_multi_strerror(mc)};
            }
        }
        return {};
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        const size_t total = size * nitems;
        if (userdata == nullptr)
            return 0;
        auto* self = static_cast<CurlExchange*>(userdata);

        std::string_view line(buffer, total);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.remove_suffix(1);

        // A status line starts a new response (interim 1xx responses come first)
        if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
            self->_headers = HeaderMap{};
            self->_headersComplete = false;
            self->_status = 0;
            self->_reason.clear();
            auto sp = line.find(' ');
            if (sp != std::string_view::npos) {
                auto rest = line.substr(sp + 1);
                int code = 0;
                auto res = std::from_chars(rest.data(), rest.data() + std::min<size_t>(3, rest.size()),
                                           code);
                if (res.ec == std::errc())
                    self->_status = code;
                if (rest.size() > 4)
                    self->_reason = trim(rest.substr(4));
            }
            return total;
        }

        if (line.empty()) {
            if (self->_status >= 200)
                self->_headersComplete = true;
            return total;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos)
            return total;
        self->_headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        const size_t total = size * nmemb;
        if (userdata == nullptr)
            return 0;
        auto* self = static_cast<CurlExchange*>(userdata);
        self->_headersComplete = true;
        if (self->available() >= kMaxPendingBytes) {
            self->_paused = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->_pending.append(ptr, total);
        return total;
    }

    CURLM* _multi{nullptr};
    CURL* _easy{nullptr};
    curl_slist* _headerList{nullptr};
    bool _attached{false};
    char _errorBuffer[CURL_ERROR_SIZE]{};

    int _status{0};
    std::string _reason;
    HeaderMap _headers;
    bool _headersComplete{false};

    bool _done{false};
    bool _paused{false};
    CURLcode _result{CURLE_OK};

    std::string _pending;
    std::size_t _offset{0};
};

class CurlTransport final : public IHttpTransport {
public:
    CurlTransport(ClientConfig config, std::shared_ptr<spdlog::logger> logger)
        : _config(std::move(config)), _logger(logging::orNull(std::move(logger))) {
        ensureCurlGlobalInit();
    }

    Expected<HttpResponse> send(const HttpRequest& request) override {
        std::string url = request.url;
        HeaderMap headers = request.headers;

        for (int hop = 0;; ++hop) {
            auto exchange = std::make_unique<CurlExchange>();
            if (auto st = exchange->start(request.method, url, headers, _config); !st.ok())
                return st.error();
            if (auto hr = exchange->awaitHeaders(); !hr.ok())
                return hr.error();

            const int status = exchange->status();
            if (isRedirectStatus(status) && _config.redirects.follow) {
                auto location = exchange->redirectUrl();
                if (location) {
                    auto next = _config.redirects.nextHop(request, hop + 1, url, *location);
                    if (!next.ok())
                        return next.error();
                    _logger->debug("following {} redirect {} -> {}", status, url, *location);
                    headers = std::move(next).value();
                    url = std::move(*location);
                    continue;
                }
            }

            HttpResponse response;
            response.statusCode = status;
            response.reason = exchange->reason();
            response.headers = exchange->headers();
            response.effectiveUrl = url;
            response.contentLength = declaredLength(response.headers);
            if (auto cr = response.headers.get("Content-Range"))
                response.contentRange = parseContentRange(*cr);
            response.body = std::move(exchange);

            _logger->trace("{} {} -> {}", request.method, url, response.statusLine());
            return response;
        }
    }

private:
    ClientConfig _config;
    std::shared_ptr<spdlog::logger> _logger;
};

} // namespace

std::unique_ptr<IHttpTransport> makeCurlTransport(ClientConfig config,
                                                  std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<CurlTransport>(std::move(config), std::move(logger));
}

} // namespace rangeio::http
