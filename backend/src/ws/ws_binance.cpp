#include "ws.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <atomic>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Every operation is started async on the session's own io_context and then
// driven by the calling thread until it completes. That gives connect and the
// handshakes a deadline (tcp_stream expiry), reads an idle timeout (websocket
// keep-alive pings), and lets close() cancel whatever is in flight.
struct BinanceWs::Impl
{
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    std::string host;
    std::string port;
    WsTimeouts timeouts;

    net::io_context ioc{1};
    net::ssl::context ssl_ctx{net::ssl::context::tls_client};

    std::unique_ptr<Stream> ws; // touched only by the thread driving ioc
    beast::flat_buffer buffer;
    std::atomic<bool> closing{false};
    unsigned next_id = 1;

    Impl(std::string h, std::string p, WsTimeouts t)
        : host(std::move(h)), port(std::move(p)), timeouts(t)
    {
        // Recommended client settings
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(net::ssl::verify_peer);
    }

    // Starts one operation and runs the loop until its handler has run.
    // Handlers posted by close() run here as well.
    template <class Start>
    beast::error_code run(Start &&start)
    {
        beast::error_code result;
        bool done = false;
        start([&result, &done](beast::error_code ec, auto &&...) {
            result = ec;
            done = true;
        });
        while (!done) {
            if (ioc.stopped()) ioc.restart();
            ioc.run_one();
        }
        return result;
    }

    void check(beast::error_code ec, const std::string &what)
    {
        if (!ec) return;
        if (closing.load(std::memory_order_relaxed) && ec != beast::error::timeout)
            throw beast::system_error{net::error::operation_aborted, "closed during open"};
        throw beast::system_error{ec, what};
    }

    void open(const std::vector<std::string> &streams)
    {
        closing.store(false, std::memory_order_relaxed);
        // finish off the previous session and any close() aimed at it
        if (ws) beast::get_lowest_layer(*ws).close();
        ioc.restart();
        ioc.poll();

        ws = std::make_unique<Stream>(ioc, ssl_ctx); // drops any previous session
        buffer.clear();
        auto &sock = beast::get_lowest_layer(*ws);

        tcp::resolver resolver{ioc};
        auto const results = resolver.resolve(host, port);

        // TCP connect
        sock.expires_after(timeouts.connect);
        check(run([&](auto handler) { sock.async_connect(results, std::move(handler)); }),
              "connect to " + host + ":" + port);

        // SNI (Server Name Indication) for TLS
        if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), host.c_str())) {
            throw beast::system_error{
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "SNI set failed"
            };
        }

        // SSL handshake
        sock.expires_after(timeouts.handshake);
        check(run([&](auto handler) {
                  ws->next_layer().async_handshake(net::ssl::stream_base::client, std::move(handler));
              }),
              "TLS handshake");

        // From here the websocket stream keeps its own timers
        sock.expires_never();
        websocket::stream_base::timeout opt{timeouts.handshake, timeouts.idle, true};
        ws->set_option(opt);

        // WS handshake on the combined-stream endpoint
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req){
            req.set(http::field::user_agent, std::string("crypto-monitor/1.0"));
        }));
        check(run([&](auto handler) { ws->async_handshake(host + ":" + port, "/stream", std::move(handler)); }),
              "WebSocket handshake");
        ws->text(true);

        // {"method":"SUBSCRIBE","params":["btcusdt@trade","btcusdt@depth20@100ms"],"id":1}
        std::string sub = "{\"method\":\"SUBSCRIBE\",\"params\":[";
        for (std::size_t i = 0; i < streams.size(); ++i) {
            if (i) sub += ",";
            sub += "\"" + streams[i] + "\"";
        }
        sub += "],\"id\":" + std::to_string(next_id++) + "}";
        check(run([&](auto handler) { ws->async_write(net::buffer(sub), std::move(handler)); }), "subscribe");

        if (closing.load(std::memory_order_relaxed))
            throw beast::system_error{net::error::operation_aborted, "closed during open"};
    }

    bool read(std::string &out)
    {
        if (!ws) return false;
        buffer.clear();
        auto ec = run([&](auto handler) { ws->async_read(buffer, std::move(handler)); });
        if (ec)
        {
            // Expected during close() or orderly remote shutdown
            if (ec == websocket::error::closed ||
                closing.load(std::memory_order_relaxed)) {
                return false;
            }
            // beast::error::timeout here means the idle deadline passed
            throw beast::system_error{ec};
        }
        out = beast::buffers_to_string(buffer.cdata());
        return true;
    }

    void close() noexcept
    {
        closing.store(true, std::memory_order_relaxed);
        // The stream is not thread-safe: the socket is closed by the thread
        // driving ioc, which aborts its pending connect, handshake or read.
        // Nobody driving it: the next open() runs this before replacing ws.
        net::post(ioc, [this] {
            if (ws) beast::get_lowest_layer(*ws).close();
        });
    }
};

BinanceWs::BinanceWs(std::string host, std::string port, WsTimeouts timeouts)
    : impl_(new Impl(std::move(host), std::move(port), timeouts)) {}
BinanceWs::~BinanceWs() { delete impl_; }

// The outer class methods just forward to the implementation
void BinanceWs::open(const std::vector<std::string> &streams) { impl_->open(streams); }
bool BinanceWs::read(std::string &out) { return impl_->read(out); }
void BinanceWs::close() noexcept { impl_->close(); }
