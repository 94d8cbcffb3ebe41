#include "shutdown_signals.hpp"

#include <string>

#include "util/log.hpp"

void watch_shutdown_signals(boost::asio::signal_set& signals, std::function<void(int)> on_signal) {
    signals.async_wait([&signals, on_signal = std::move(on_signal)](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        log_line("setup", "signal " + std::to_string(signo) + " received; send it again to exit immediately");
        boost::system::error_code cec;
        signals.clear(cec);
        if (cec) log_line("setup", "restoring default signal handling failed: " + cec.message());
        on_signal(signo);
    });
}
