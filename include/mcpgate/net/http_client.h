#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::net {

using Headers = std::map<std::string, std::string>;

struct Url {
    std::string scheme;
    std::string host;
    std::uint16_t port = 80;
    std::string target = "/";
};

// Accepts "scheme://host[:port][/path][?query]". Fails with InvalidUrl.
Result<Url> parseUrl(std::string_view raw);

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    // Header names lower-cased
    Headers headers;

    bool ok() const { return status >= 200 && status < 300; }
    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string{} : it->second;
    }
};

// One-shot HTTP/1.1 client over Boost.Beast. Each call opens a fresh connection and the
// timeout bounds the whole exchange (connect, write, read). Plain http only.
class HttpClient {
public:
    explicit HttpClient(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

    boost::asio::awaitable<Result<HttpResponse>> post(const std::string& url, std::string body,
                                                      const Headers& headers,
                                                      std::chrono::milliseconds timeout);

    boost::asio::awaitable<Result<HttpResponse>> get(const std::string& url, const Headers& headers,
                                                     std::chrono::milliseconds timeout);

    boost::asio::awaitable<Result<HttpResponse>>
    request(boost::beast::http::verb verb, const std::string& url, std::string body,
            const Headers& headers, std::chrono::milliseconds timeout);

private:
    boost::asio::any_io_executor executor_;
};

} // namespace mcpgate::net
