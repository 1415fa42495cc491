#pragma once

#include "net/http_fetcher.hpp"
#include <boost/asio/io_context.hpp>

namespace voxcall {

// Plain http:// GET over Boost.Beast. One connection per request.
class BeastHttpFetcher : public HttpFetcher {
public:
    explicit BeastHttpFetcher(boost::asio::io_context& io) : io_(io) {}

    void get(const std::string& url, FetchCallback done) override;

private:
    boost::asio::io_context& io_;
};

} // namespace voxcall
