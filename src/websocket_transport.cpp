#include "websocket_transport.hpp"
#include "errors.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <exception>
#include <functional>
#include <future>

namespace websocket = beast::websocket;

//////////////////////////////////////////////////////////////////////////
// Constructor / Destructor
//////////////////////////////////////////////////////////////////////////

WebSocketTransport::WebSocketTransport(std::shared_ptr<Logger> logger,
                                       std::chrono::milliseconds connect_timeout,
                                       std::chrono::milliseconds close_timeout)
    : logger_(std::move(logger))
    , connect_timeout_(connect_timeout)
    , close_timeout_(close_timeout)
    , ioc_()
    , resolver_(ioc_.get_executor())
    , close_timer_(ioc_)
{
    if (!logger_) {
        throw ValidationError("WebSocketTransport requires a logger");
    }
}

WebSocketTransport::~WebSocketTransport() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR(logger_->quill_logger(), "[WebSocketTransport] Error while closing: {}", e.what());
    }
}

//////////////////////////////////////////////////////////////////////////
// Public API
//////////////////////////////////////////////////////////////////////////

void WebSocketTransport::open(const std::string& host, const std::string& port, const std::string& target) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (open_) {
        throw ConnectionError("WebSocketTransport is already open");
    }
    // A previous connection lost by the peer leaves a finished io thread behind.
    join_io_thread();

    ioc_.restart();
    outbox_.clear();
    buffer_.consume(buffer_.size());
    ws_ = std::make_unique<websocket::stream<beast::tcp_stream>>(ioc_);
    host_ = host;
    target_ = target.empty() ? "/ws" : target;
    url_ = "ws://" + host + ":" + port + target_;
    closing_ = false;

    open_result_ = std::promise<beast::error_code>();
    std::future<beast::error_code> opened = open_result_.get_future();

    resolver_.async_resolve(host, port, std::bind_front(&WebSocketTransport::on_resolve, this));

    io_thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            LOG_ERROR(logger_->quill_logger(), "[WebSocketTransport] io_context exception: {}", e.what());
            open_ = false;
        }
    });

    // Connect and handshake carry their own deadlines; this one also bounds the resolve.
    bool timed_out = false;
    if (opened.wait_for(connect_timeout_) != std::future_status::ready) {
        timed_out = true;
        closing_ = true;
        net::post(ioc_, [this]() {
            resolver_.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(*ws_).socket().close(ignored);
        });
    }
    beast::error_code ec = opened.get();

    if (timed_out || ec) {
        closing_ = true;
        open_ = false;
        net::post(ioc_, [this]() {
            beast::error_code ignored;
            beast::get_lowest_layer(*ws_).socket().close(ignored);
        });
        join_io_thread();
        ws_.reset();
        const std::string cause = timed_out ? "timed out after " + std::to_string(connect_timeout_.count()) + " ms"
                                            : ec.message();
        throw ConnectionError("Failed to open " + url_ + ": " + cause);
    }

    LOG_INFO(logger_->quill_logger(), "[WebSocketTransport] Connected to {}", url_);
}

void WebSocketTransport::send(const std::string& message) {
    if (!open_) {
        throw ConnectionError("WebSocketTransport is not open");
    }
    net::post(ioc_, [this, message]() {
        outbox_.push_back(message);
        if (outbox_.size() > 1) {
            return; // a write is already in flight
        }
        do_write();
    });
}

void WebSocketTransport::close() {
    if (io_thread_.joinable() && io_thread_.get_id() == std::this_thread::get_id()) {
        // Called from a handler on the io thread: tear the socket down, the owner joins later.
        closing_ = true;
        open_ = false;
        if (ws_) {
            beast::error_code ignored;
            beast::get_lowest_layer(*ws_).socket().close(ignored);
        }
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!io_thread_.joinable()) {
        open_ = false;
        return;
    }

    closing_ = true;
    if (!open_.exchange(false)) {
        // Already lost: the io thread has run out of work or is about to.
        join_io_thread();
        return;
    }

    net::post(ioc_, [this]() {
        close_timer_.expires_after(close_timeout_);
        close_timer_.async_wait([this](beast::error_code ec) {
            if (!ec) {
                LOG_WARNING(logger_->quill_logger(), "[WebSocketTransport] Close handshake timed out");
                beast::error_code ignored;
                beast::get_lowest_layer(*ws_).socket().close(ignored);
            }
        });
        ws_->async_close(websocket::close_code::normal, [this](beast::error_code ec) {
            close_timer_.cancel();
            if (ec) {
                LOG_DEBUG(logger_->quill_logger(), "[WebSocketTransport] Close error: {}", ec.message());
            }
            beast::error_code ignored;
            beast::get_lowest_layer(*ws_).socket().close(ignored);
        });
    });

    join_io_thread();
    LOG_INFO(logger_->quill_logger(), "[WebSocketTransport] Closed");
}

bool WebSocketTransport::is_open() const {
    return open_;
}

//////////////////////////////////////////////////////////////////////////
// Networking callbacks
//////////////////////////////////////////////////////////////////////////

void WebSocketTransport::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        open_result_.set_value(ec);
        return;
    }
    beast::get_lowest_layer(*ws_).expires_after(connect_timeout_);
    beast::get_lowest_layer(*ws_).async_connect(results, std::bind_front(&WebSocketTransport::on_connect, this));
}

void WebSocketTransport::on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
        open_result_.set_value(ec);
        return;
    }
    // The websocket stream times the handshake itself from here on.
    beast::get_lowest_layer(*ws_).expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = connect_timeout_;
    ws_->set_option(timeouts);
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "LiquidEnergy-Client/1.0");
    }));

    ws_->async_handshake(host_ + ":" + std::to_string(ep.port()), target_,
                         std::bind_front(&WebSocketTransport::on_handshake, this));
}

void WebSocketTransport::on_handshake(beast::error_code ec) {
    if (ec || closing_) {
        open_result_.set_value(ec ? ec : beast::error_code(net::error::operation_aborted));
        return;
    }
    ws_->text(true);
    open_ = true;
    do_read();
    open_result_.set_value(ec);
}

void WebSocketTransport::do_read() {
    ws_->async_read(buffer_, std::bind_front(&WebSocketTransport::on_read, this));
}

void WebSocketTransport::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        if (closing_) {
            return;
        }
        open_ = false;
        std::string reason = (ec == websocket::error::closed) ? "connection closed by peer" : ec.message();
        LOG_WARNING(logger_->quill_logger(), "[WebSocketTransport] Read error: {}", reason);
        if (on_close_) {
            on_close_(reason);
        }
        return;
    }

    std::string msg = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    if (on_message_) {
        try {
            on_message_(std::move(msg));
        } catch (const std::exception& e) {
            LOG_ERROR(logger_->quill_logger(), "[WebSocketTransport] Message handler error: {}", e.what());
        }
    }

    do_read();
}

void WebSocketTransport::do_write() {
    ws_->async_write(net::buffer(outbox_.front()), std::bind_front(&WebSocketTransport::on_write, this));
}

void WebSocketTransport::on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR(logger_->quill_logger(), "[WebSocketTransport] Write error: {}", ec.message());
        outbox_.clear();
        return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
        do_write();
    }
}

void WebSocketTransport::join_io_thread() {
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}
