#pragma once
#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "md_types.hpp"

enum class BookApply : std::uint8_t
{
    Applied = 0,
    Stale = 1,        // sequence regressed; stored book unchanged
    UnknownSymbol = 2 // not in the tracked set
};

// Consistent (book, trades) pair for one symbol, copied out under one lock.
struct MarketSnapshot {
    std::string symbol;
    std::optional<OrderBookUpdate> book;
    std::vector<TradeRecord> trades; // oldest first
};

struct SymbolSummary {
    std::string symbol;
    std::size_t trades{0};
    bool has_book{false};
    std::uint64_t sequence{0};
    std::size_t bid_levels{0};
    std::size_t ask_levels{0};
};

// In-memory cache of the tracked symbols' latest book and recent trades.
// - The symbol set is fixed at construction.
// - Trade history is a bounded FIFO per symbol.
// - Book updates are accepted only with non-decreasing sequence.
// - One shared_mutex guards everything; readers copy out.
class MarketState {
public:
    MarketState(const std::vector<std::string>& symbols, std::size_t history_capacity);

    MarketState(const MarketState&) = delete;
    MarketState& operator=(const MarketState&) = delete;

    // false if the symbol is not tracked
    bool record_trade(const TradeRecord& t);

    BookApply replace_book(const OrderBookUpdate& u);

    // Forget the symbol's book so the next update is accepted regardless of sequence.
    void reset_book(const std::string& symbol);

    std::optional<MarketSnapshot> snapshot(const std::string& symbol) const;
    std::vector<SymbolSummary> summary() const;

    bool tracks(const std::string& symbol) const;
    const std::vector<std::string>& symbols() const noexcept { return symbols_; }
    std::size_t history_capacity() const noexcept { return capacity_; }

private:
    struct Entry {
        explicit Entry(std::size_t cap) : trades(cap) {}
        std::optional<OrderBookUpdate> book;
        boost::circular_buffer<TradeRecord> trades;
    };

    std::vector<std::string> symbols_; // configuration order
    std::size_t capacity_;

    mutable std::shared_mutex m_;
    std::unordered_map<std::string, Entry> entries_;
};
