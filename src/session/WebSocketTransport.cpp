#include "sdcp/session/WebSocketTransport.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"

#include <future>
#include <memory>

namespace sdcp::session {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

namespace {

std::chrono::milliseconds sanitize(std::chrono::milliseconds timeout) {
    return timeout.count() < 0 ? std::chrono::milliseconds::zero() : timeout;
}

error_code cancelled() {
    return std::make_error_code(std::errc::operation_canceled);
}

} // namespace

WebSocketTransport::WebSocketTransport(net::asio::io_context& io, std::size_t maxMessageSize)
: strand_(net::asio::make_strand(io))
, resolver_(strand_)
, ws_(strand_)
, maxMessageSize_(maxMessageSize)
{}

WebSocketTransport::~WebSocketTransport() {
    close();
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this]{ return outstanding_ == 0; });
}

error_code WebSocketTransport::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    if (closed_) {
        return cancelled();
    }
    timeout = sanitize(timeout);
    host_ = endpoint.host + ":" + std::to_string(endpoint.port);
    path_ = endpoint.path;

    auto done = std::make_shared<std::promise<error_code>>();
    auto result = done->get_future();

    net::asio::dispatch(strand_, [this, host = endpoint.host, port = std::to_string(endpoint.port),
                                  timeout, done]() {
        if (closed_) {
            done->set_value(cancelled());
            return;
        }
        resolver_.async_resolve(host, port,
            [this, timeout, done](const beast::error_code& ec, net::tcp::resolver::results_type results) {
                if (ec || closed_) {
                    done->set_value(ec ? error_code(ec) : cancelled());
                    return;
                }
                auto& socket = beast::get_lowest_layer(ws_);
                socket.expires_after(timeout);
                socket.async_connect(results,
                    [this, timeout, done](const beast::error_code& ec, const net::tcp::endpoint&) {
                        if (ec || closed_) {
                            done->set_value(ec ? error_code(ec) : cancelled());
                            return;
                        }
                        // The websocket layer owns the timeouts from here on.
                        beast::get_lowest_layer(ws_).expires_never();
                        websocket::stream_base::timeout limits{};
                        limits.handshake_timeout = timeout;
                        limits.idle_timeout = websocket::stream_base::none();
                        limits.keep_alive_pings = false;
                        ws_.set_option(limits);
                        ws_.read_message_max(maxMessageSize_);

                        ws_.async_handshake(host_, path_, [this, done](const beast::error_code& ec) {
                            if (ec == websocket::condition::handshake_failed) {
                                done->set_value(make_error_code(errc::protocol_mismatch));
                                return;
                            }
                            if (ec || closed_) {
                                done->set_value(ec ? error_code(ec) : cancelled());
                                return;
                            }
                            ws_.text(true);
                            ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
                                if (kind == websocket::frame_type::pong) {
                                    push(std::string(config::SDCP_KEEPALIVE_REPLY));
                                }
                            });
                            startRead();
                            done->set_value(error_code{});
                        });
                    });
            });
    });

    const auto ec = result.get();
    if (ec) {
        logError("[WebSocket] upgrade to ", host_, path_, " failed: ", ec.message(), "\n");
    }
    return ec;
}

error_code WebSocketTransport::send(std::string_view text, std::chrono::milliseconds timeout) {
    std::lock_guard writeLock(writeMutex_);
    if (closed_) {
        return cancelled();
    }

    auto payload = std::make_shared<std::string>(text);
    auto done = std::make_shared<std::promise<error_code>>();
    auto result = done->get_future();

    net::asio::dispatch(strand_, [this, payload, done]() {
        ws_.async_write(net::asio::buffer(*payload),
            [payload, done](const beast::error_code& ec, std::size_t) {
                done->set_value(ec);
            });
    });

    if (result.wait_for(sanitize(timeout)) != std::future_status::ready) {
        // A stalled write leaves the stream unusable; drop the connection and
        // let the write complete with the abort.
        logError("[WebSocket] write of ", payload->size(), " bytes timed out\n");
        close();
        result.wait();
        return net::timed_out();
    }
    return result.get();
}

expected<std::string> WebSocketTransport::receive(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, sanitize(timeout), [this]{
        return closed_ || !inbox_.empty() || readError_;
    });
    if (closed_) {
        return unexpected(cancelled());
    }
    if (!inbox_.empty()) {
        auto message = std::move(inbox_.front());
        inbox_.pop_front();
        return message;
    }
    if (readError_) {
        return unexpected(readError_);
    }
    return unexpected(net::timed_out());
}

void WebSocketTransport::close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
        ++outstanding_;
    }
    cv_.notify_all();

    // No closing handshake: the printer may already be gone and close must
    // not wait on the network.
    net::asio::post(strand_, [this]() {
        resolver_.cancel();
        auto& stream = beast::get_lowest_layer(ws_);
        beast::error_code ignored;
        stream.socket().shutdown(net::tcp::socket::shutdown_both, ignored);
        stream.close();

        std::lock_guard lock(mutex_);
        --outstanding_;
        cv_.notify_all();
    });
}

void WebSocketTransport::startRead() {
    {
        std::lock_guard lock(mutex_);
        ++outstanding_;
    }
    ws_.async_read(buffer_, [this](const beast::error_code& ec, std::size_t) {
        if (!ec) {
            push(beast::buffers_to_string(buffer_.data()));
            buffer_.consume(buffer_.size());
            if (!closed_) {
                startRead();
            }
        }
        std::lock_guard lock(mutex_);
        if (ec && !readError_) {
            readError_ = ec;
        }
        --outstanding_;
        cv_.notify_all();
    });
}

void WebSocketTransport::push(std::string message) {
    {
        std::lock_guard lock(mutex_);
        inbox_.push_back(std::move(message));
    }
    cv_.notify_all();
}

TransportFactory webSocketTransportFactory(net::asio::io_context& io) {
    return [&io]() -> std::unique_ptr<MessageTransport> {
        return std::make_unique<WebSocketTransport>(io);
    };
}

} // namespace sdcp::session
