#pragma once
#include <boost/asio/signal_set.hpp>
#include <functional>

// Arms `signals` for one delivery: on_signal runs for the first signal, and
// the set is then cleared so the process gets the default action back. A
// second Ctrl-C during a slow teardown therefore terminates immediately.
void watch_shutdown_signals(boost::asio::signal_set& signals, std::function<void(int)> on_signal);
