#pragma once
#include <string>

// Maps tracked tickers ("BTC") to venue instruments and back.
// Quote asset is fixed per process (e.g. "USDT").
struct SymbolCodec
{
    // "BTC" -> "BTCUSDT"
    static std::string to_instrument(const std::string &canonical, const std::string &quote);
    // "BTC" -> "btcusdt" (stream-name prefix)
    static std::string to_stream(const std::string &canonical, const std::string &quote);
    // "BTCUSDT" or "btcusdt" -> "BTC"; returns the upper-cased input if it lacks the quote suffix
    static std::string to_canonical(const std::string &venue_sym, const std::string &quote);
    // Upper-case ASCII copy.
    static std::string normalize(std::string s);
};
