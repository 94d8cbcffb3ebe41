#include "server/http_routes.hpp"

#include <cassert>
#include <iostream>

static http::response<http::string_body> get(const ViewContext& ctx, const std::string& target,
                                             http::verb verb = http::verb::get) {
    http::request<http::string_body> req{verb, target, 11};
    http::response<http::string_body> res;
    handle_request(ctx, req, res);
    return res;
}

static bool has(const http::response<http::string_body>& res, const std::string& s) {
    return res.body().find(s) != std::string::npos;
}

int main() {
    MarketState state({"BTC", "ETH"}, 10);
    for (std::uint64_t i = 1; i <= 3; ++i) {
        TradeRecord t;
        t.symbol = "BTC";
        t.trade_id = i;
        t.price = 100.0 + static_cast<double>(i);
        t.quantity = 0.25;
        t.side = i % 2 ? TradeSide::Buy : TradeSide::Sell;
        state.record_trade(t);
    }
    OrderBookUpdate u;
    u.symbol = "ETH";
    u.sequence = 42;
    u.bids = {{100.5, 2.0}, {100.0, 3.0}};
    u.asks = {{101.5, 1.0}};
    state.replace_book(u);

    ViewContext ctx{state, nullptr, nullptr};

    auto health = get(ctx, "/api/health");
    assert(health.result() == http::status::ok);
    assert(health[http::field::content_type] == "application/json");
    assert(health.body() == R"({"status":"ok"})");

    auto syms = get(ctx, "/api/symbols");
    assert(syms.body() == R"(["BTC","ETH"])");

    auto status = get(ctx, "/api/status");
    assert(has(status, R"({"symbol":"BTC","trades":3,"sequence":0,"has_book":false})"));
    assert(has(status, R"({"symbol":"ETH","trades":0,"sequence":42,"has_book":true})"));
    assert(!has(status, "connection"));

    auto book = get(ctx, "/api/book?symbol=eth&depth=1");
    assert(book.result() == http::status::ok);
    assert(has(book, R"("sequence":42)"));
    assert(has(book, R"("bids":[[100.5,2]])"));
    assert(has(book, R"("asks":[[101.5,1]])"));

    auto empty_book = get(ctx, "/api/book?symbol=BTC");
    assert(has(empty_book, R"("sequence":null,"bids":[],"asks":[])"));

    auto trades = get(ctx, "/api/trades?symbol=BTC&limit=2");
    assert(!has(trades, R"("id":1,)"));
    assert(has(trades, R"({"id":2,"price":102,"qty":0.25,"side":"sell","ts_ms":0})"));
    assert(has(trades, R"("id":3,)"));

    assert(get(ctx, "/api/trades?symbol=DOGE").result() == http::status::not_found);
    assert(get(ctx, "/api/book").result() == http::status::not_found);
    assert(get(ctx, "/nowhere").result() == http::status::not_found);
    assert(get(ctx, "/api/health", http::verb::post).result() == http::status::method_not_allowed);

    std::cout << "OK\n";
    return 0;
}
