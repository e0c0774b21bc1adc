#pragma once
#include <atomic>
#include <deque>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include "event_loop.hpp"
#include "transport.hpp"

// wss:// Transport on Boost.Beast. Network I/O runs on a private thread;
// every handler is handed to the event loop through post_external().
class BeastTransport : public Transport {
public:
    explicit BeastTransport(EventLoop& loop);
    ~BeastTransport() override;
    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    void open(const std::string& url, TransportHandlers handlers) override;
    bool is_open() const override { return open_; }
    void send(const std::string& text) override;
    void close() override;
private:
    using Socket = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    EventLoop& loop_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    Socket ws_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    TransportHandlers handlers_;
    std::string host_;
    std::string target_;
    // Touched only on the I/O thread
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    bool closing_;
    bool writing_;
    std::atomic<bool> open_;
    std::thread thread_;

    void on_resolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void on_connect(boost::beast::error_code ec);
    void on_tls_handshake(boost::beast::error_code ec);
    void on_ws_handshake(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec);
    void do_write();
    void start_close();
    void fail(const char* where, boost::beast::error_code ec);
};

// Factory for LiveSessionClient: one BeastTransport per connection attempt.
TransportFactory beast_transport_factory(EventLoop& loop);
