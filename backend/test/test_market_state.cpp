#include "md/market_state.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

static TradeRecord trade(const std::string& sym, std::uint64_t id, double px) {
    TradeRecord t;
    t.symbol = sym;
    t.trade_id = id;
    t.price = px;
    t.quantity = 1.0;
    return t;
}

static OrderBookUpdate book(const std::string& sym, std::uint64_t seq) {
    OrderBookUpdate u;
    u.symbol = sym;
    u.sequence = seq;
    u.bids = {{100.0 + seq, 1.0}};
    u.asks = {{101.0 + seq, 2.0}};
    return u;
}

int main() {
    MarketState ms({"BTC", "ETH", "BTC"}, 3);
    assert(ms.symbols().size() == 2);
    assert(ms.tracks("BTC") && ms.tracks("ETH") && !ms.tracks("SOL"));
    assert(ms.history_capacity() == 3);

    // Bounded history keeps the most recent trades in arrival order
    for (std::uint64_t i = 1; i <= 5; ++i) assert(ms.record_trade(trade("BTC", i, 1000.0 + i)));
    auto snap = ms.snapshot("BTC");
    assert(snap && snap->trades.size() == 3);
    assert(snap->trades[0].trade_id == 3);
    assert(snap->trades[2].trade_id == 5);
    assert(!snap->book);

    // Untracked symbols change nothing
    assert(!ms.record_trade(trade("SOL", 1, 1.0)));
    assert(ms.replace_book(book("SOL", 1)) == BookApply::UnknownSymbol);
    assert(!ms.snapshot("SOL"));

    // Sequence regression is rejected: [5, 6, 4, 7] ends at 7
    assert(ms.replace_book(book("ETH", 5)) == BookApply::Applied);
    assert(ms.replace_book(book("ETH", 6)) == BookApply::Applied);
    assert(ms.replace_book(book("ETH", 4)) == BookApply::Stale);
    assert(ms.snapshot("ETH")->book->sequence == 6);
    assert(ms.replace_book(book("ETH", 7)) == BookApply::Applied);
    assert(ms.snapshot("ETH")->book->sequence == 7);

    // Equal sequence is a repeat of the same top-N: accepted
    assert(ms.replace_book(book("ETH", 7)) == BookApply::Applied);

    // After a reset any sequence is accepted again
    ms.reset_book("ETH");
    assert(!ms.snapshot("ETH")->book);
    assert(ms.replace_book(book("ETH", 2)) == BookApply::Applied);

    auto sum = ms.summary();
    assert(sum.size() == 2);
    assert(sum[0].symbol == "BTC" && sum[0].trades == 3 && !sum[0].has_book);
    assert(sum[1].symbol == "ETH" && sum[1].has_book && sum[1].sequence == 2);
    assert(sum[1].bid_levels == 1 && sum[1].ask_levels == 1);

    // Readers alongside a writer never observe more than capacity
    MarketState shared({"BTC"}, 100);
    std::thread writer([&] {
        for (std::uint64_t i = 0; i < 20000; ++i) shared.record_trade(trade("BTC", i, 1.0));
    });
    for (int i = 0; i < 2000; ++i) {
        auto s = shared.snapshot("BTC");
        assert(s && s->trades.size() <= 100);
    }
    writer.join();
    auto last = shared.snapshot("BTC");
    assert(last->trades.size() == 100 && last->trades.back().trade_id == 19999);

    bool threw = false;
    try {
        MarketState bad({"BTC"}, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "OK\n";
    return 0;
}
