#include "http_view.hpp"
#include "http_server.hpp"
#include "util/log.hpp"

#include <boost/asio/io_context.hpp>

HttpMarketView::HttpMarketView(ViewContext ctx, std::string address, unsigned short port)
    : ctx_(ctx), address_(std::move(address)), port_(port) {}

HttpMarketView::~HttpMarketView() { stop(); }

bool HttpMarketView::start() {
    std::lock_guard<std::mutex> lk(m_);
    if (running_.load()) return true;
    teardown(); // a loop that ended on its own
    try {
        ioc_ = std::make_unique<boost::asio::io_context>(1);
        tcp::endpoint ep{boost::asio::ip::make_address(address_), port_};
        server_ = std::make_unique<HttpServer>(*ioc_, ep, [this](auto const& req, auto& res) {
            handle_request(ctx_, req, res);
        });
        server_->run();
        bound_port_ = server_->port();
    } catch (const std::exception& e) {
        last_error_ = e.what();
        log_line("http", "view failed to start on " + address_ + ":" + std::to_string(port_) + ": " + last_error_);
        server_.reset();
        ioc_.reset();
        return false;
    }

    last_error_.clear();
    running_.store(true);
    thread_ = std::thread([this] {
        try {
            ioc_->run();
        } catch (const std::exception& e) {
            log_line("http", std::string("view stopped on error: ") + e.what());
        }
        running_.store(false);
    });
    log_line("http", "view listening on http://" + address_ + ":" + std::to_string(bound_port_));
    return true;
}

void HttpMarketView::stop() {
    std::lock_guard<std::mutex> lk(m_);
    teardown();
}

void HttpMarketView::teardown() {
    if (!ioc_) return;
    ioc_->stop();
    if (thread_.joinable()) thread_.join();
    // loop thread is gone: the acceptor can be closed from here
    server_->stop();
    server_.reset();
    ioc_.reset();
    running_.store(false);
}
