#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "util/log.hpp"

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Small async HTTP/1.1 server: one strand per connection, keep-alive,
// idle connections dropped after kIdleTimeout. Requests are answered by the
// handler; CORS headers are added for browser dashboards.
class HttpServer {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using HandlerFn = std::function<void(const Request&, Response&)>;

    static constexpr std::chrono::seconds kIdleTimeout{30};
    static constexpr std::size_t kBodyLimit = 16 * 1024; // views are GET-only

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { accept_next(); }

    // Stops accepting; open connections end with the io_context.
    void stop() {
        boost::beast::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short port() const {
        boost::beast::error_code ec;
        return acceptor_.local_endpoint(ec).port();
    }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(tcp::socket s, HandlerFn h) : stream_(std::move(s)), handler_(std::move(h)) {}

        void start() { read_request(); }

    private:
        void read_request() {
            parser_.emplace();
            parser_->body_limit(kBodyLimit);
            stream_.expires_after(kIdleTimeout);
            http::async_read(stream_, buffer_, *parser_,
                [self = shared_from_this()](boost::beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(boost::beast::error_code ec) {
            if (ec == http::error::end_of_stream || ec == boost::beast::error::timeout) return close();
            if (ec) {
                if (ec != boost::asio::error::operation_aborted)
                    log_line("http", "read failed: " + ec.message());
                return close();
            }

            auto req = std::make_shared<Request>(parser_->release());
            auto res = std::make_shared<Response>();
            res->version(req->version());
            res->keep_alive(req->keep_alive());

            if (req->method() == http::verb::options) {
                res->result(http::status::no_content);
            } else {
                try {
                    handler_(*req, *res);
                } catch (const std::exception& e) {
                    log_line("http", std::string("handler error: ") + e.what());
                    res->result(http::status::internal_server_error);
                    res->set(http::field::content_type, "application/json");
                    res->body() = R"({"error":"internal error"})";
                }
            }
            res->set(http::field::access_control_allow_origin, "*");
            res->set(http::field::access_control_allow_methods, "GET, OPTIONS");
            res->prepare_payload();

            http::async_write(stream_, *res,
                [self = shared_from_this(), res](boost::beast::error_code wec, std::size_t) {
                    if (wec || !res->keep_alive()) return self->close();
                    self->read_request();
                });
        }

        void close() {
            boost::beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        boost::beast::tcp_stream stream_;
        boost::beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        HandlerFn handler_;
    };

    void accept_next() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s) {
                if (ec == boost::asio::error::operation_aborted) return; // stop()
                if (!ec) std::make_shared<Connection>(std::move(s), handler_)->start();
                else log_line("http", "accept failed: " + ec.message());
                if (acceptor_.is_open()) accept_next();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
};
