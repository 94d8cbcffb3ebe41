#pragma once
#include <chrono>
#include <string>
#include <vector>

// Interface for a market-data WebSocket session.
// open():  connects and subscribes; throws on failure
// read():  blocks for the next text frame; false on orderly close, throws on error
// close(): may be called from any thread; unblocks a pending open() or read()
struct IMarketWs
{
    virtual ~IMarketWs() = default;
    virtual void open(const std::vector<std::string> &streams) = 0;
    virtual bool read(std::string &out) = 0;
    virtual void close() noexcept = 0;
};

// NOTE: Each exchange connection implementation has pointer to Implementation (PIMPL) to hide Boost headers from dependents

struct WsTimeouts
{
    std::chrono::milliseconds connect{10000};   // TCP connect
    std::chrono::milliseconds handshake{10000}; // TLS, then WebSocket upgrade
    // No frame for this long (pings unanswered) ends the session with a
    // timeout error; the ingestor then reconnects.
    std::chrono::milliseconds idle{30000};
};

class BinanceWs : public IMarketWs
{
public:
    // host like "stream.binance.com", port "9443"
    BinanceWs(std::string host, std::string port, WsTimeouts timeouts = {});
    ~BinanceWs();
    // Non-copyable
    BinanceWs(const BinanceWs &) = delete;
    BinanceWs &operator=(const BinanceWs &) = delete;

    void open(const std::vector<std::string> &streams) override;
    bool read(std::string &out) override;
    void close() noexcept override;

private:
    struct Impl;
    Impl *impl_;
};
