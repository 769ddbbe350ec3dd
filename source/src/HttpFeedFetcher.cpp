#include "HttpFeedFetcher.hpp"
#include "FeedParser.hpp"
#include "Settings.hpp"

#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>

namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace {

bool is_redirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

template <typename Stream>
net::awaitable<http::response<http::string_body>> exchange(Stream& stream, const http::request<http::empty_body>& req, size_t body_limit) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);

    co_await http::async_read(stream, buffer, parser, net::use_awaitable);

    co_return parser.release();
}

}

HttpFeedFetcher::HttpFeedFetcher(std::chrono::seconds timeout, size_t body_limit)
    : _ssl_ctx(ssl::context::tls_client), _timeout(timeout), _body_limit(body_limit) {
    _ssl_ctx.set_default_verify_paths();
    _ssl_ctx.set_verify_mode(ssl::verify_peer);
}

boost::asio::awaitable<std::string> HttpFeedFetcher::async_fetch(std::string url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) throw FeedFetchError("Invalid URL: " + url);

    boost::urls::url current(*parsed);

    for (int hop = 0; hop <= MAX_REDIRECTS; ++hop) {
        http::response<http::string_body> res;

        try {
            res = co_await request(current);
        }
        catch (const boost::system::system_error& e) {
            throw FeedFetchError(std::string(current.buffer()) + ": " + e.code().message());
        }

        auto status = res.result_int();

        if (is_redirect(status)) {
            auto location = res[http::field::location];
            if (location.empty()) throw FeedFetchError("Redirect without a location from " + std::string(current.buffer()));

            auto ref = boost::urls::parse_uri_reference(std::string_view(location.data(), location.size()));
            if (!ref) throw FeedFetchError("Bad redirect location: " + std::string(location));

            boost::urls::url next;
            if (!boost::urls::resolve(current, *ref, next)) throw FeedFetchError("Cannot resolve redirect: " + std::string(location));

            BOOST_LOG_TRIVIAL(debug) << "Redirect " << current.buffer() << " -> " << next.buffer();
            current = std::move(next);
            continue;
        }

        if (status != 200) {
            throw FeedFetchError("HTTP " + std::to_string(status) + " from " + std::string(current.buffer()));
        }

        co_return std::move(res.body());
    }

    throw FeedFetchError("Too many redirects for " + url);
}

boost::asio::awaitable<http::response<http::string_body>> HttpFeedFetcher::request(const boost::urls::url& url) {
    const bool tls = url.scheme_id() == boost::urls::scheme::https;
    if (!tls && url.scheme_id() != boost::urls::scheme::http) {
        throw FeedFetchError("Unsupported scheme: " + std::string(url.scheme()));
    }

    const std::string host = url.host();
    const std::string port = url.has_port() ? std::string(url.port()) : (tls ? "443" : "80");
    std::string target = url.encoded_target();
    if (target.empty()) target = "/";

    http::request<http::empty_body> req{ http::verb::get, target, 11 };
    req.set(http::field::host, host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/rss+xml, application/atom+xml, application/xml, */*");

    auto executor = co_await net::this_coro::executor;

    tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    if (!tls) {
        beast::tcp_stream stream(executor);
        stream.expires_after(_timeout);

        co_await stream.async_connect(results, net::use_awaitable);
        auto res = co_await exchange(stream, req, _body_limit);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) BOOST_LOG_TRIVIAL(debug) << "Socket shutdown: " << ec.message();

        co_return res;
    }

    beast::ssl_stream<beast::tcp_stream> stream(executor, _ssl_ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        throw FeedFetchError("Could not set SNI for " + host);
    }
    stream.set_verify_callback(ssl::host_name_verification(host));

    beast::get_lowest_layer(stream).expires_after(_timeout);

    co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    auto res = co_await exchange(stream, req, _body_limit);

    // plenty of servers drop the connection without a close_notify
    boost::system::error_code ec;
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
        BOOST_LOG_TRIVIAL(debug) << "TLS shutdown: " << ec.message();
    }

    co_return res;
}
