#pragma once

#include <string>

#include <boost/asio.hpp>

class BaseFeedFetcher {
public:
    virtual ~BaseFeedFetcher() = default;

    // body of a successful GET; throws FeedFetchError
    [[nodiscard]] virtual boost::asio::awaitable<std::string> async_fetch(std::string url) = 0;
};
