#include "realtime/beast_transport.h"
#include "logger.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <atomic>
#include <future>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace rtvoice {
namespace realtime {

namespace {

struct ParsedUrl {
    std::string host;
    std::string port;
    std::string target;
};

bool parse_wss_url(const std::string& url, ParsedUrl& out) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }
    std::string rest = url.substr(scheme.size());
    std::string::size_type slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);

    std::string::size_type colon = authority.find(':');
    if (colon == std::string::npos) {
        out.host = authority;
        out.port = "443";
    } else {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    return !out.host.empty() && !out.port.empty();
}

} // namespace

class BeastTransport::Impl : public std::enable_shared_from_this<BeastTransport::Impl> {
public:
    using WsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    explicit Impl(int connect_timeout_ms)
        : connect_timeout_(std::chrono::milliseconds(connect_timeout_ms)),
          ctx_(ssl::context::tlsv12_client),
          open_(false),
          closing_(false) {}

    VoidResult connect(const std::string& url,
                       const std::map<std::string, std::string>& headers,
                       TransportHandlers handlers) {
        ParsedUrl parsed;
        if (!parse_wss_url(url, parsed)) {
            return Error(ErrorType::ConnectionFailed, "Unsupported realtime URL: " + url);
        }
        handlers_ = std::move(handlers);

        beast::error_code ec;
        ctx_.set_default_verify_paths(ec);
        if (ec) {
            Logger::warn("Could not load default CA paths: " + ec.message());
        }
        ctx_.set_verify_mode(ssl::verify_peer);

        tcp::resolver resolver{ioc_};
        auto const results = resolver.resolve(parsed.host, parsed.port, ec);
        if (ec) {
            return Error(ErrorType::ConnectionFailed, "Resolve " + parsed.host + " failed: " + ec.message());
        }

        ws_ = std::make_unique<WsStream>(ioc_, ctx_);

        // SNI, required by most TLS front ends
        if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), parsed.host.c_str())) {
            return Error(ErrorType::ConnectionFailed, "Failed to set SNI host name");
        }
        ws_->next_layer().set_verify_callback(ssl::host_name_verification(parsed.host));

        // Each step runs the context until the single pending operation completes
        auto run_step = [this]() {
            ioc_.restart();
            ioc_.run();
        };

        beast::get_lowest_layer(*ws_).expires_after(connect_timeout_);
        beast::get_lowest_layer(*ws_).async_connect(results,
            [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        run_step();
        if (ec) {
            return Error(ErrorType::ConnectionFailed, "TCP connect failed: " + ec.message());
        }

        beast::get_lowest_layer(*ws_).expires_after(connect_timeout_);
        ws_->next_layer().async_handshake(ssl::stream_base::client,
            [&ec](beast::error_code e) { ec = e; });
        run_step();
        if (ec) {
            return Error(ErrorType::ConnectionFailed, "TLS handshake failed: " + ec.message());
        }

        beast::get_lowest_layer(*ws_).expires_never();

        websocket::stream_base::timeout timeouts{
            connect_timeout_,               // handshake and close
            websocket::stream_base::none(), // idle
            false                           // keep-alive pings
        };
        ws_->set_option(timeouts);

        ws_->set_option(websocket::stream_base::decorator(
            [headers](websocket::request_type& req) {
                req.set(http::field::user_agent, "rtvoice");
                for (const auto& h : headers) {
                    req.set(h.first, h.second);
                }
            }));

        std::string host_header = parsed.host;
        if (parsed.port != "443") {
            host_header += ":" + parsed.port;
        }
        ws_->async_handshake(host_header, parsed.target, [&ec](beast::error_code e) { ec = e; });
        run_step();
        if (ec) {
            return Error(ErrorType::ConnectionFailed, "WebSocket handshake failed: " + ec.message());
        }
        ws_->text(true);

        open_ = true;
        ioc_.restart();
        work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
            ioc_.get_executor());
        do_read();

        auto self = shared_from_this();
        io_thread_ = std::thread([self]() {
            self->ioc_.run();
        });

        LOG_RT("WebSocket connected to " + parsed.host + parsed.target);
        return VoidResult();
    }

    VoidResult send(const std::string& text) {
        if (!open_) {
            return Error(ErrorType::ConnectionLost, "WebSocket not open");
        }
        if (ioc_.get_executor().running_in_this_thread()) {
            return write_now(text);
        }

        auto promise = std::make_shared<std::promise<VoidResult>>();
        std::future<VoidResult> result = promise->get_future();
        auto self = shared_from_this();
        net::post(ioc_, [self, text, promise]() {
            promise->set_value(self->write_now(text));
        });
        if (result.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            return Error(ErrorType::Timeout, "WebSocket write timed out");
        }
        return result.get();
    }

    void close() {
        if (closing_.exchange(true)) {
            return;
        }

        if (io_thread_.joinable()) {
            // The stream and the work guard are only touched on the I/O thread
            auto self = shared_from_this();
            net::post(ioc_, [self]() {
                if (self->ws_ && self->ws_->is_open()) {
                    self->ws_->async_close(websocket::close_code::normal,
                        [self](beast::error_code ec) {
                            if (ec) {
                                LOG_RT("WebSocket close: " + ec.message());
                            }
                        });
                }
                self->work_.reset();
            });
        }
        join_io_thread();
    }

    bool is_open() const {
        return open_;
    }

    void join_io_thread() {
        if (!io_thread_.joinable()) {
            return;
        }
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            // Called from a handler; the thread holds its own reference and exits on its own
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }

private:
    VoidResult write_now(const std::string& text) {
        if (!open_ || !ws_) {
            return Error(ErrorType::ConnectionLost, "WebSocket not open");
        }
        beast::error_code ec;
        ws_->write(net::buffer(text), ec);
        if (ec) {
            return Error(ErrorType::ConnectionLost, "WebSocket write failed: " + ec.message());
        }
        return VoidResult();
    }

    void do_read() {
        auto self = shared_from_this();
        ws_->async_read(buffer_, [self](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            finish(ec);
            return;
        }
        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message) {
            handlers_.on_message(message);
        }
        if (ws_->is_open()) {
            do_read();
        } else {
            finish(websocket::error::closed);
        }
    }

    void finish(beast::error_code ec) {
        bool was_open = open_.exchange(false);
        if (!was_open || closing_) {
            return;
        }

        int code = 1006;
        std::string reason = ec.message();
        if (ec == websocket::error::closed) {
            code = static_cast<int>(ws_->reason().code);
            reason = std::string(ws_->reason().reason.data(), ws_->reason().reason.size());
        }
        LOG_RT("WebSocket closed (code " + std::to_string(code) + "): " + reason);

        // Let the context wind down once nothing else is pending
        work_.reset();
        if (handlers_.on_close) {
            handlers_.on_close(code, reason);
        }
    }

    std::chrono::steady_clock::duration connect_timeout_;
    net::io_context ioc_;
    ssl::context ctx_;
    std::unique_ptr<WsStream> ws_;
    beast::flat_buffer buffer_;
    TransportHandlers handlers_;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::atomic<bool> open_;
    std::atomic<bool> closing_;
    std::thread io_thread_;
};

BeastTransport::BeastTransport(int connect_timeout_ms)
    : pimpl_(std::make_shared<Impl>(connect_timeout_ms)) {}

BeastTransport::~BeastTransport() {
    pimpl_->close();
}

VoidResult BeastTransport::connect(const std::string& url,
                                   const std::map<std::string, std::string>& headers,
                                   TransportHandlers handlers) {
    return pimpl_->connect(url, headers, std::move(handlers));
}

VoidResult BeastTransport::send(const std::string& text) {
    return pimpl_->send(text);
}

void BeastTransport::close() {
    pimpl_->close();
}

bool BeastTransport::is_open() const {
    return pimpl_->is_open();
}

TransportFactory BeastTransport::factory(int connect_timeout_ms) {
    return [connect_timeout_ms]() -> std::shared_ptr<ITransport> {
        return std::make_shared<BeastTransport>(connect_timeout_ms);
    };
}

} // namespace realtime
} // namespace rtvoice
