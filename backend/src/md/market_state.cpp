#include "market_state.hpp"

#include <mutex>
#include <stdexcept>

MarketState::MarketState(const std::vector<std::string>& symbols, std::size_t history_capacity)
    : capacity_(history_capacity) {
    if (capacity_ == 0) throw std::invalid_argument("trade history capacity must be positive");
    for (const auto& s : symbols) {
        if (entries_.count(s)) continue;
        entries_.emplace(s, Entry{capacity_});
        symbols_.push_back(s);
    }
}

bool MarketState::record_trade(const TradeRecord& t) {
    std::unique_lock lk(m_);
    auto it = entries_.find(t.symbol);
    if (it == entries_.end()) return false;
    it->second.trades.push_back(t); // overwrites the oldest when full
    return true;
}

BookApply MarketState::replace_book(const OrderBookUpdate& u) {
    std::unique_lock lk(m_);
    auto it = entries_.find(u.symbol);
    if (it == entries_.end()) return BookApply::UnknownSymbol;
    auto& book = it->second.book;
    if (book && u.sequence < book->sequence) return BookApply::Stale;
    book = u;
    return BookApply::Applied;
}

void MarketState::reset_book(const std::string& symbol) {
    std::unique_lock lk(m_);
    auto it = entries_.find(symbol);
    if (it != entries_.end()) it->second.book.reset();
}

std::optional<MarketSnapshot> MarketState::snapshot(const std::string& symbol) const {
    std::shared_lock lk(m_);
    auto it = entries_.find(symbol);
    if (it == entries_.end()) return std::nullopt;
    MarketSnapshot out;
    out.symbol = symbol;
    out.book = it->second.book;
    out.trades.assign(it->second.trades.begin(), it->second.trades.end());
    return out;
}

std::vector<SymbolSummary> MarketState::summary() const {
    std::vector<SymbolSummary> out;
    out.reserve(symbols_.size());
    std::shared_lock lk(m_);
    for (const auto& sym : symbols_) {
        const auto& e = entries_.at(sym);
        SymbolSummary s;
        s.symbol = sym;
        s.trades = e.trades.size();
        if (e.book) {
            s.has_book = true;
            s.sequence = e.book->sequence;
            s.bid_levels = e.book->bids.size();
            s.ask_levels = e.book->asks.size();
        }
        out.push_back(std::move(s));
    }
    return out;
}

bool MarketState::tracks(const std::string& symbol) const {
    // entries_ keys never change after construction
    return entries_.find(symbol) != entries_.end();
}
