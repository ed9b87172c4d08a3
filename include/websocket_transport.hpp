#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "itransport.hpp"
#include "logger.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @class WebSocketTransport
 * @brief ITransport over a plain-TCP Boost.Beast WebSocket (ws://host:port/target).
 *
 * open() runs resolve, connect and handshake as async operations on a private io_context,
 * driven by one dedicated thread, and blocks at most the connect timeout for them. After that
 * an async_read chain on the same context delivers inbound frames.
 * Outbound frames are queued on the same context so that only one async_write is in flight.
 */
class WebSocketTransport : public ITransport {
private:
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds close_timeout_;

    net::io_context ioc_;
    tcp::resolver resolver_;
    std::unique_ptr<beast::websocket::stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    net::steady_timer close_timer_;
    std::deque<std::string> outbox_;
    std::thread io_thread_;

    std::string host_;
    std::string target_;
    std::string url_;
    std::promise<beast::error_code> open_result_;

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
    std::mutex lifecycle_mutex_;

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void join_io_thread();

public:
    explicit WebSocketTransport(std::shared_ptr<Logger> logger,
                                std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000),
                                std::chrono::milliseconds close_timeout = std::chrono::milliseconds(1000));
    ~WebSocketTransport() noexcept override;

    void open(const std::string& host, const std::string& port, const std::string& target) override;
    void send(const std::string& message) override;
    void close() override;
    bool is_open() const override;
};
