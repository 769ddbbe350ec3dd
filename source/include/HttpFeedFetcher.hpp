#pragma once

#include "BaseFeedFetcher.hpp"

#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/url.hpp>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;

// GET over http or https with a per-request deadline, following redirects
class HttpFeedFetcher : public BaseFeedFetcher {
public:
    explicit HttpFeedFetcher(std::chrono::seconds timeout = std::chrono::seconds(30), size_t body_limit = 8 * 1024 * 1024);

    [[nodiscard]] boost::asio::awaitable<std::string> async_fetch(std::string url) override;

private:
    [[nodiscard]] boost::asio::awaitable<http::response<http::string_body>> request(const boost::urls::url& url);

    static constexpr int MAX_REDIRECTS = 5;

    ssl::context _ssl_ctx;
    std::chrono::seconds _timeout;
    size_t _body_limit;
};
