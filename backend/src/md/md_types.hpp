/*
Normalized market data records
*/

#pragma once
#include <string>
#include <cstdint>
#include <variant>
#include <vector>
#include <utility>

enum class TradeSide : std::uint8_t { Buy = 0, Sell = 1 };

inline const char* to_cstr(TradeSide s) { return s == TradeSide::Buy ? "buy" : "sell"; }

// (price, quantity), best-first within a side
using PriceLevel = std::pair<double, double>;

struct TradeRecord
{
    std::string symbol; // tracked ticker, e.g. "BTC"
    double price{0};
    double quantity{0};
    TradeSide side{TradeSide::Buy}; // aggressor side
    std::uint64_t trade_id{0};
    std::int64_t exchange_ts_ms{0};
    std::int64_t recv_ts_ns{0};
};

// Full top-N replacement of one symbol's book.
struct OrderBookUpdate
{
    std::string symbol;
    std::uint64_t sequence{0}; // venue lastUpdateId
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
    std::int64_t ts_ns{0};
};

using MarketRecord = std::variant<TradeRecord, OrderBookUpdate>;

inline const std::string& record_symbol(const MarketRecord& r)
{
    return std::visit([](const auto& v) -> const std::string& { return v.symbol; }, r);
}

enum class ConnectionState : std::uint8_t
{
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Closing = 3
};

inline const char* to_cstr(ConnectionState s)
{
    switch (s)
    {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Closing: return "Closing";
    }
    return "?";
}
