#include "beast_transport.hpp"
#include "net_url.hpp"
#include <openssl/ssl.h>
#include <iostream>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

constexpr std::chrono::seconds CONNECT_TIMEOUT{30};

BeastTransport::BeastTransport(EventLoop& loop)
    : loop_(loop),
      ssl_ctx_(ssl::context::tls_client),
      resolver_(ioc_),
      ws_(ioc_, ssl_ctx_),
      work_(net::make_work_guard(ioc_)),
      closing_(false),
      writing_(false),
      open_(false) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
    thread_ = std::thread([this]() { ioc_.run(); });
}

BeastTransport::~BeastTransport() {
    work_.reset();
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
}

void BeastTransport::open(const std::string& url, TransportHandlers handlers) {
    handlers_ = std::move(handlers);
    std::optional<Url> parsed = parse_url(url);
    if (!parsed || parsed->scheme != "wss") {
        auto on_error = handlers_.on_error;
        loop_.post_external([on_error]() {
            if (on_error) on_error("Unsupported session URL");
        });
        return;
    }
    host_ = parsed->host;
    target_ = parsed->target;
    std::string port = parsed->port;
    net::post(ioc_, [this, port]() {
        resolver_.async_resolve(host_, port, [this](beast::error_code ec, tcp::resolver::results_type results) {
            on_resolve(ec, results);
        });
    });
}

void BeastTransport::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail("resolve", ec);
    beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
    beast::get_lowest_layer(ws_).async_connect(results, [this](beast::error_code ec, tcp::endpoint) {
        on_connect(ec);
    });
}

void BeastTransport::on_connect(beast::error_code ec) {
    if (ec) return fail("connect", ec);
    if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str())) {
        return fail("tls setup", net::error::make_error_code(net::error::invalid_argument));
    }
    ws_.next_layer().set_verify_callback(ssl::host_name_verification(host_));
    beast::get_lowest_layer(ws_).expires_after(CONNECT_TIMEOUT);
    ws_.next_layer().async_handshake(ssl::stream_base::client, [this](beast::error_code ec) {
        on_tls_handshake(ec);
    });
}

void BeastTransport::on_tls_handshake(beast::error_code ec) {
    if (ec) return fail("tls handshake", ec);
    // The websocket stream keeps its own timers from here on
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.async_handshake(host_, target_, [this](beast::error_code ec) { on_ws_handshake(ec); });
}

void BeastTransport::on_ws_handshake(beast::error_code ec) {
    if (ec) return fail("websocket handshake", ec);
    if (closing_) return;
    ws_.text(true);
    open_ = true;
    auto on_open = handlers_.on_open;
    loop_.post_external([on_open]() {
        if (on_open) on_open();
    });
    do_read();
    if (!outbox_.empty()) do_write();
}

void BeastTransport::do_read() {
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) { on_read(ec); });
}

void BeastTransport::on_read(beast::error_code ec) {
    if (ec == websocket::error::closed) {
        open_ = false;
        const websocket::close_reason& reason = ws_.reason();
        int code = static_cast<int>(reason.code);
        std::string text(reason.reason.data(), reason.reason.size());
        auto on_close = handlers_.on_close;
        loop_.post_external([on_close, code, text]() {
            if (on_close) on_close(code, text);
        });
        return;
    }
    if (ec) return fail("read", ec);
    // Text and binary frames both carry JSON on this stream
    std::string payload = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    auto on_message = handlers_.on_message;
    loop_.post_external([on_message, payload]() {
        if (on_message) on_message(payload);
    });
    do_read();
}

void BeastTransport::send(const std::string& text) {
    net::post(ioc_, [this, text]() {
        if (closing_) return;
        outbox_.push_back(text);
        if (open_ && !writing_) do_write();
    });
}

void BeastTransport::do_write() {
    writing_ = true;
    ws_.async_write(net::buffer(outbox_.front()), [this](beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) return fail("write", ec);
        if (closing_) return start_close();
        outbox_.pop_front();
        if (!outbox_.empty()) do_write();
    });
}

// Only one write may be outstanding and the close frame counts as one
void BeastTransport::start_close() {
    outbox_.clear();
    ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
        open_ = false;
        if (ec && ec != net::error::operation_aborted) {
            std::cerr << "[Transport] close: " << ec.message() << std::endl;
        }
    });
}

void BeastTransport::close() {
    net::post(ioc_, [this]() {
        if (closing_) return;
        closing_ = true;
        if (!open_) {
            // Still connecting: abandon the attempt
            outbox_.clear();
            resolver_.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
            return;
        }
        if (!writing_) start_close();
    });
}

void BeastTransport::fail(const char* where, beast::error_code ec) {
    open_ = false;
    if (closing_ || ec == net::error::operation_aborted) return;
    std::string message = std::string(where) + ": " + ec.message();
    std::cerr << "[Transport] " << host_ << " " << message << std::endl;
    auto on_error = handlers_.on_error;
    loop_.post_external([on_error, message]() {
        if (on_error) on_error(message);
    });
}

TransportFactory beast_transport_factory(EventLoop& loop) {
    EventLoop* l = &loop;
    return [l]() -> std::unique_ptr<Transport> { return std::make_unique<BeastTransport>(*l); };
}
