#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "app/command_io.hpp"
#include "server/http_routes.hpp"

class HttpServer;
namespace boost { namespace asio { class io_context; } }

// Read-only JSON view of the market state served over HTTP on its own thread.
class HttpMarketView final : public IMarketView {
public:
    HttpMarketView(ViewContext ctx, std::string address, unsigned short port);
    ~HttpMarketView();

    bool start() override;
    void stop() override;
    bool running() const override { return running_.load(); }

    // Port actually bound (the configured one may be 0); 0 before start().
    unsigned short port() const noexcept { return bound_port_; }
    // Why the last start() failed; empty after a successful start.
    const std::string& last_error() const noexcept { return last_error_; }

private:
    void teardown(); // caller holds m_

    ViewContext ctx_;
    std::string address_;
    unsigned short port_;
    unsigned short bound_port_{0};
    std::string last_error_;

    std::mutex m_;
    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<HttpServer> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};
