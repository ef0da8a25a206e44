#include <mcpgate/core/format.h>
#include <mcpgate/net/http_client.h>
#include <mcpgate/version.hpp>

#include <algorithm>
#include <cctype>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::net {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::ip::tcp;

Result<Url> parseUrl(std::string_view raw) {
    auto sep = raw.find("://");
    if (sep == std::string_view::npos || sep == 0)
        return Error{ErrorCode::InvalidUrl, format("Invalid URL: {}", std::string(raw))};

    Url url;
    url.scheme = std::string(raw.substr(0, sep));
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https")
        return Error{ErrorCode::InvalidUrl,
                     format("Unsupported URL scheme '{}' in {}", url.scheme, std::string(raw))};
    url.port = url.scheme == "https" ? 443 : 80;

    auto rest = raw.substr(sep + 3);
    auto slash = rest.find_first_of("/?");
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        url.target = std::string(rest.substr(slash));
        if (url.target.front() == '?')
            url.target.insert(url.target.begin(), '/');
    }
    // Drop userinfo
    if (auto at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);
    if (authority.empty())
        return Error{ErrorCode::InvalidUrl, format("URL has no host: {}", std::string(raw))};

    std::string_view host = authority;
    std::string_view portText;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            return Error{ErrorCode::InvalidUrl, format("Invalid IPv6 host in {}", std::string(raw))};
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            portText = authority.substr(close + 2);
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        portText = authority.substr(colon + 1);
    }
    if (host.empty())
        return Error{ErrorCode::InvalidUrl, format("URL has no host: {}", std::string(raw))};
    url.host = std::string(host);

    if (!portText.empty()) {
        unsigned long port = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return Error{ErrorCode::InvalidUrl, format("Invalid port in {}", std::string(raw))};
            port = port * 10 + static_cast<unsigned long>(c - '0');
            if (port > 65535)
                return Error{ErrorCode::InvalidUrl, format("Invalid port in {}", std::string(raw))};
        }
        if (port == 0)
            return Error{ErrorCode::InvalidUrl, format("Invalid port in {}", std::string(raw))};
        url.port = static_cast<std::uint16_t>(port);
    }
    return url;
}

namespace {

Error networkError(const beast::error_code& ec, std::string_view phase, const Url& url) {
    if (ec == beast::error::timeout) {
        return Error{ErrorCode::Timeout,
                     format("HTTP {} to {}:{} timed out", std::string(phase), url.host, url.port)};
    }
    return Error{ErrorCode::ConnectionFailed, format("HTTP {} to {}:{} failed: {}",
                                                     std::string(phase), url.host, url.port,
                                                     ec.message())};
}

} // namespace

boost::asio::awaitable<Result<HttpResponse>>
HttpClient::post(const std::string& url, std::string body, const Headers& headers,
                 std::chrono::milliseconds timeout) {
    co_return co_await request(http::verb::post, url, std::move(body), headers, timeout);
}

boost::asio::awaitable<Result<HttpResponse>>
HttpClient::get(const std::string& url, const Headers& headers, std::chrono::milliseconds timeout) {
    co_return co_await request(http::verb::get, url, std::string{}, headers, timeout);
}

boost::asio::awaitable<Result<HttpResponse>>
HttpClient::request(http::verb verb, const std::string& rawUrl, std::string body,
                    const Headers& headers, std::chrono::milliseconds timeout) {
    auto parsed = parseUrl(rawUrl);
    if (!parsed)
        co_return parsed.error();
    const Url url = parsed.value();
    if (url.scheme != "http") {
        co_return Error{ErrorCode::ConnectionFailed,
                        format("{} is not supported (plain http only): {}", url.scheme, rawUrl)};
    }

    beast::error_code ec;
    tcp::resolver resolver(executor_);
    auto endpoints = co_await resolver.async_resolve(
        url.host, std::to_string(url.port), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return networkError(ec, "resolve", url);

    beast::tcp_stream stream(executor_);
    stream.expires_after(timeout);
    co_await stream.async_connect(endpoints,
                                  boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return networkError(ec, "connect", url);

    http::request<http::string_body> req{verb, url.target, 11};
    req.set(http::field::host, url.host + ":" + std::to_string(url.port));
    req.set(http::field::user_agent, std::string("mcpgate/") + version::string_v);
    if (verb == http::verb::post) {
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
    }
    for (const auto& [name, value] : headers)
        req.set(name, value);
    req.keep_alive(false);
    req.body() = std::move(body);
    req.prepare_payload();

    co_await http::async_write(stream, req,
                               boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return networkError(ec, "write", url);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res,
                              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return networkError(ec, "read", url);

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    HttpResponse out;
    out.status = res.result_int();
    out.body = std::move(res.body());
    for (const auto& field : res) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.headers[name] = std::string(field.value());
    }
    spdlog::trace("HTTP {} {} -> {}", std::string(http::to_string(verb)), rawUrl, out.status);
    co_return out;
}

} // namespace mcpgate::net
