#pragma once
#include "md/feed_decoder.hpp"
#include <optional>
#include <string>

// REST client for Binance depth snapshots, used to resynchronize a book.
class BinanceRest : public IBookSnapshotSource {
public:
    // base_url like "https://api.binance.com"
    BinanceRest(std::string base_url, std::string quote, int depth = 20, long timeout_ms = 5000);

    std::optional<OrderBookUpdate> fetch(const std::string& symbol) override;

    // GET url; returns false on transport error or non-2xx status
    bool http_get(const std::string& url, std::string& body, std::string& err) const;

private:
    std::string base_url_;
    std::string quote_;
    int depth_;
    long timeout_ms_;
};
