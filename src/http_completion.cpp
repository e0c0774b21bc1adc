#include "http_completion.hpp"
#include "base64.hpp"
#include "errors.hpp"
#include "net_url.hpp"
#include "session_messages.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <functional>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

json make_completion_request(const CompletionConfig& config, const std::string& prompt,
                             const std::optional<std::vector<uint8_t>>& image) {
    json parts = json::array();
    parts.push_back({{"text", prompt}});
    if (image) {
        parts.push_back({{"inlineData", {{"mimeType", "image/jpeg"}, {"data", base64_encode(*image)}}}});
    }
    return {
        {"contents", json::array({{{"parts", parts}}})},
        {"generationConfig", {
            {"temperature", config.temperature},
            {"maxOutputTokens", config.max_output_tokens},
        }},
    };
}

CompletionResult parse_completion_response(int status, const std::string& body) {
    if (status < 200 || status >= 300) {
        return {"", RequestError::from_status(status, body)};
    }
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return {"", RequestError(ErrorKind::MalformedMessage, status, "Completion answer is not JSON")};
    }
    std::string text;
    auto candidates = j.find("candidates");
    if (candidates != j.end() && candidates->is_array() && !candidates->empty()) {
        const json& first = (*candidates)[0];
        if (first.contains("content") && first["content"].contains("parts") && first["content"]["parts"].is_array()) {
            for (const auto& part : first["content"]["parts"]) {
                if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                    text += part["text"].get<std::string>();
                }
            }
        }
    }
    return {trim(text), std::nullopt};
}

namespace {

using Done = std::function<void(beast::error_code)>;

// One request/response exchange driven by the caller's io_context so the
// stream deadline applies to every step.
template <class Stream, class Handshake>
void start_exchange(tcp::resolver& resolver, Stream& stream, const Url& url,
                    http::request<http::string_body>& req, http::response<http::string_body>& res,
                    beast::flat_buffer& buffer, std::chrono::milliseconds timeout, Handshake handshake,
                    beast::error_code& failure) {
    Stream* s = &stream;
    auto* rq = &req;
    auto* rs = &res;
    auto* buf = &buffer;
    beast::error_code* out = &failure;
    auto fail = [out](beast::error_code ec) {
        if (!*out) *out = ec;
    };
    resolver.async_resolve(url.host, url.port, [=](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec);
        beast::get_lowest_layer(*s).expires_after(timeout);
        beast::get_lowest_layer(*s).async_connect(results, [=](beast::error_code ec, tcp::endpoint) {
            if (ec) return fail(ec);
            handshake([=](beast::error_code ec) {
                if (ec) return fail(ec);
                http::async_write(*s, *rq, [=](beast::error_code ec, std::size_t) {
                    if (ec) return fail(ec);
                    http::async_read(*s, *buf, *rs, [=](beast::error_code ec, std::size_t) {
                        if (ec) fail(ec);
                    });
                });
            });
        });
    });
}

} // namespace

HttpTextCompletion::HttpTextCompletion(EventLoop& loop, CompletionConfig config, std::string api_key)
    : loop_(loop), config_(std::move(config)), api_key_(std::move(api_key)), stopping_(false) {
    int count = config_.workers < 1 ? 1 : config_.workers;
    for (int i = 0; i < count; ++i) workers_.emplace_back([this]() { worker(); });
}

HttpTextCompletion::~HttpTextCompletion() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        jobs_.clear();
    }
    wake_.notify_all();
    for (auto& t : workers_) t.join();
}

void HttpTextCompletion::complete(const std::string& prompt, const std::optional<std::vector<uint8_t>>& image,
                                  Callback on_done) {
    std::string body = make_completion_request(config_, prompt, image).dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(Job{std::move(body), std::move(on_done)});
    }
    wake_.notify_one();
}

void HttpTextCompletion::worker() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        CompletionResult result = send_request(job.body);
        Callback on_done = std::move(job.on_done);
        loop_.post_external([on_done, result]() {
            if (on_done) on_done(result);
        });
    }
}

CompletionResult HttpTextCompletion::send_request(const std::string& body) const {
    std::optional<Url> url = parse_url(config_.url);
    if (!url || (url->scheme != "https" && url->scheme != "http")) {
        return {"", RequestError(ErrorKind::Request, 0, "Unsupported completion URL: " + config_.url)};
    }
    http::request<http::string_body> req{http::verb::post, url->target, 11};
    req.set(http::field::host, url->host);
    req.set(http::field::user_agent, "aisle_assist");
    req.set(http::field::content_type, "application/json");
    if (!api_key_.empty()) req.set("x-goog-api-key", api_key_);
    req.body() = body;
    req.prepare_payload();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    http::response<http::string_body> res;
    beast::flat_buffer buffer;
    beast::error_code failure;
    auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    if (is_secure(*url)) {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
            return {"", RequestError(ErrorKind::Request, 0, "TLS setup failed for " + url->host)};
        }
        stream.set_verify_callback(ssl::host_name_verification(url->host));
        start_exchange(resolver, stream, *url, req, res, buffer, timeout,
                       [&stream](Done done) { stream.async_handshake(ssl::stream_base::client, done); }, failure);
        ioc.run();
    } else {
        beast::tcp_stream stream(ioc);
        start_exchange(resolver, stream, *url, req, res, buffer, timeout,
                       [](Done done) { done(beast::error_code()); }, failure);
        ioc.run();
    }

    if (failure) {
        std::cerr << "[Completion] " << url->host << ": " << failure.message() << std::endl;
        return {"", RequestError(ErrorKind::Request, 0, "Request failed: " + failure.message())};
    }
    return parse_completion_response(static_cast<int>(res.result_int()), res.body());
}
