#include "net/beast_http_fetcher.hpp"
#include "net/url.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>

namespace voxcall {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

class HttpGet : public std::enable_shared_from_this<HttpGet> {
public:
    HttpGet(asio::io_context& io, HttpFetcher::FetchCallback done)
        : resolver_(io)
        , stream_(io)
        , done_(std::move(done)) {}

    void start(const Url& url) {
        request_.version(11);
        request_.method(http::verb::get);
        request_.target(url.target);
        request_.set(http::field::host, url.host + ":" + url.port);
        request_.set(http::field::user_agent, "voxcall");
        request_.set(http::field::accept, "application/json");

        resolver_.async_resolve(url.host, url.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return self->finish(std::nullopt, "resolve: " + ec.message());
                self->stream_.async_connect(results,
                    [self](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        self->onConnect(ec);
                    });
            });
    }

private:
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    HttpFetcher::FetchCallback done_;

    void onConnect(beast::error_code ec) {
        if (ec) return finish(std::nullopt, "connect: " + ec.message());
        http::async_write(stream_, request_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) return self->finish(std::nullopt, "write: " + ec.message());
                http::async_read(self->stream_, self->buffer_, self->response_,
                    [self](beast::error_code ec, std::size_t) {
                        self->onRead(ec);
                    });
            });
    }

    void onRead(beast::error_code ec) {
        if (ec) return finish(std::nullopt, "read: " + ec.message());

        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const unsigned status = response_.result_int();
        if (status < 200 || status >= 300) {
            return finish(std::nullopt, "HTTP " + std::to_string(status));
        }
        finish(std::move(response_.body()), {});
    }

    void finish(std::optional<std::string> body, std::string error) {
        auto done = std::move(done_);
        done_ = nullptr;
        if (done) done(std::move(body), std::move(error));
    }
};

} // namespace

void BeastHttpFetcher::get(const std::string& url, FetchCallback done) {
    auto parsed = parseUrl(url);
    if (!parsed || parsed->scheme != "http") {
        std::string reason = parsed ? "unsupported scheme " + parsed->scheme : "invalid url " + url;
        asio::post(io_, [done = std::move(done), reason]() { done(std::nullopt, reason); });
        return;
    }
    std::make_shared<HttpGet>(io_, std::move(done))->start(*parsed);
}

} // namespace voxcall
