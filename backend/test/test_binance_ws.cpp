#include "ws/ws.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

// Accepts TCP connections on loopback and never sends a byte, like a peer
// that went silent after the SYN/ACK.
struct SilentPeer {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    std::vector<tcp::socket> held;
    std::thread t;

    SilentPeer() {
        accept_next();
        t = std::thread([this] { ioc.run(); });
    }
    ~SilentPeer() {
        ioc.stop();
        t.join();
    }
    void accept_next() {
        acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket s) {
            if (ec) return;
            held.push_back(std::move(s));
            accept_next();
        });
    }
    std::string port() const { return std::to_string(acceptor.local_endpoint().port()); }
};

// Runs open() and returns how long it took to fail; asserts that it did fail.
static std::chrono::milliseconds failing_open(BinanceWs& ws) {
    const auto t0 = Clock::now();
    bool threw = false;
    try {
        ws.open({"btcusdt@trade"});
    } catch (const boost::system::system_error&) {
        threw = true;
    }
    assert(threw);
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
}

static void stalled_tls_handshake_times_out() {
    SilentPeer peer;
    WsTimeouts t;
    t.connect = 1000ms;
    t.handshake = 200ms;
    t.idle = 1000ms;
    BinanceWs ws("127.0.0.1", peer.port(), t);

    auto took = failing_open(ws);
    assert(took >= 150ms);
    assert(took < 3000ms);

    // the session stays usable: a second attempt times out the same way
    took = failing_open(ws);
    assert(took < 3000ms);
}

static void close_cuts_a_pending_open() {
    SilentPeer peer;
    WsTimeouts t;
    t.connect = 10000ms;
    t.handshake = 10000ms;
    BinanceWs ws("127.0.0.1", peer.port(), t);

    std::thread closer([&ws] {
        std::this_thread::sleep_for(200ms);
        ws.close();
    });
    const auto took = failing_open(ws);
    closer.join();
    assert(took < 3000ms);

    std::string frame;
    assert(!ws.read(frame)); // closed: nothing to read, no throw
}

static void refused_connect_fails_fast() {
    std::string port;
    {
        boost::asio::io_context ioc;
        tcp::acceptor a{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        port = std::to_string(a.local_endpoint().port());
    } // nothing listens there now
    BinanceWs ws("127.0.0.1", port);
    assert(failing_open(ws) < 3000ms);
}

static void read_before_open() {
    BinanceWs ws("127.0.0.1", "9");
    std::string frame;
    assert(!ws.read(frame));
    ws.close();
    ws.close();
}

int main() {
    stalled_tls_handshake_times_out();
    close_cuts_a_pending_open();
    refused_connect_fails_fast();
    read_before_open();
    std::cout << "OK\n";
    return 0;
}
