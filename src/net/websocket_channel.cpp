#include "net/websocket_channel.hpp"
#include "net/url.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>

namespace voxcall {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

class WebSocketChannel::Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::io_context& io, Handlers handlers)
        : resolver_(io)
        , ws_(io)
        , handlers_(std::move(handlers)) {}

    void start(const Url& url) {
        hostHeader_ = url.host + ":" + url.port;
        target_ = url.target;
        resolver_.async_resolve(url.host, url.port,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->onResolve(ec, std::move(results));
            });
    }

    void fail(const std::string& reason) {
        if (closing_) return;
        closing_ = true;
        auto handler = handlers_.onFailure;
        handlers_ = {};
        if (handler) handler(reason);
    }

    bool isOpen() const { return open_ && !closing_; }

    void send(bool text, std::vector<std::uint8_t> bytes) {
        if (!isOpen()) return;
        queue_.push_back(Outgoing{text, std::move(bytes)});
        if (queue_.size() == 1) doWrite();
    }

    // Idempotent. Pending writes flush before the close frame goes out.
    void close() {
        handlers_ = {};
        if (closing_) return;
        closing_ = true;
        if (!open_) {
            resolver_.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
            return;
        }
        if (queue_.empty()) doClose();
    }

private:
    struct Outgoing {
        bool text;
        std::vector<std::uint8_t> bytes;
    };

    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    Handlers handlers_;
    std::deque<Outgoing> queue_;
    std::string hostHeader_;
    std::string target_;
    bool open_{false};
    bool closing_{false};

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (closing_) return;
        if (ec) return fail("resolve: " + ec.message());
        beast::get_lowest_layer(ws_).async_connect(results,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                self->onConnect(ec);
            });
    }

    void onConnect(beast::error_code ec) {
        if (closing_) return;
        if (ec) return fail("connect: " + ec.message());

        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "voxcall");
        }));
        ws_.async_handshake(hostHeader_, target_,
            [self = shared_from_this()](beast::error_code ec) {
                self->onHandshake(ec);
            });
    }

    void onHandshake(beast::error_code ec) {
        if (closing_) return;
        if (ec) return fail("handshake: " + ec.message());
        open_ = true;
        doRead();
        auto handler = handlers_.onOpen;
        if (handler) handler();
    }

    void doRead() {
        ws_.async_read(buffer_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        if (ec) {
            open_ = false;
            queue_.clear();
            if (closing_) return;
            closing_ = true;
            auto handler = handlers_.onClosed;
            handlers_ = {};
            if (handler) {
                handler(ec == websocket::error::closed ? std::string("closed by server") : ec.message());
            }
            return;
        }

        const bool text = ws_.got_text();
        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        doRead();

        if (!text || closing_) return;
        auto handler = handlers_.onMessage;
        if (handler) handler(message);
    }

    void doWrite() {
        Outgoing& front = queue_.front();
        ws_.text(front.text);
        ws_.async_write(asio::buffer(front.bytes),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            // The read side reports the loss.
            queue_.clear();
            return;
        }
        queue_.pop_front();
        if (!queue_.empty()) {
            doWrite();
        } else if (closing_ && open_) {
            doClose();
        }
    }

    void doClose() {
        ws_.async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code) {
                self->open_ = false;
            });
    }
};

WebSocketChannel::WebSocketChannel(asio::io_context& io)
    : io_(io) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

void WebSocketChannel::open(const std::string& url, Handlers handlers) {
    close();
    session_ = std::make_shared<Session>(io_, std::move(handlers));

    auto parsed = parseUrl(url);
    if (!parsed || parsed->scheme != "ws") {
        // Failure is reported asynchronously, like any other connect error.
        std::string reason = parsed ? "unsupported scheme " + parsed->scheme : "invalid url " + url;
        asio::post(io_, [session = session_, reason]() { session->fail(reason); });
        return;
    }
    session_->start(*parsed);
}

void WebSocketChannel::close() {
    if (session_) {
        session_->close();
        session_.reset();
    }
}

bool WebSocketChannel::isOpen() const {
    return session_ && session_->isOpen();
}

void WebSocketChannel::sendText(const std::string& text) {
    if (!session_) return;
    session_->send(true, std::vector<std::uint8_t>(text.begin(), text.end()));
}

void WebSocketChannel::sendBinary(std::vector<std::uint8_t> bytes) {
    if (!session_) return;
    session_->send(false, std::move(bytes));
}

ChannelFactory WebSocketChannel::factory(asio::io_context& io) {
    return [&io]() -> std::unique_ptr<Channel> {
        return std::make_unique<WebSocketChannel>(io);
    };
}

} // namespace voxcall
