#include "venues/binance/parser.hpp"
#include "md/symbol_codec.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

int main() {
    // Symbol mapping
    assert(SymbolCodec::to_instrument("BTC", "USDT") == "BTCUSDT");
    assert(SymbolCodec::to_stream("eth", "USDT") == "ethusdt");
    assert(SymbolCodec::to_canonical("btcusdt", "USDT") == "BTC");
    assert(SymbolCodec::to_canonical("ETHUSDT", "USDT") == "ETH");
    assert(SymbolCodec::to_canonical("BTCEUR", "USDT") == "BTCEUR");
    assert(SymbolCodec::normalize("sol") == "SOL");

    BinanceDecoder dec("USDT");
    std::vector<MarketRecord> out;

    // Trade; m=true means the buyer was the maker, so the aggressor sold
    const std::string trade_msg =
        R"({"stream":"btcusdt@trade","data":{"e":"trade","E":1700000000001,"s":"BTCUSDT","t":12345,)"
        R"("p":"43250.10","q":"0.00500","T":1700000000000,"m":true,"M":true}})";
    assert(dec.decode(trade_msg, out) == DecodeStatus::Records);
    assert(out.size() == 1);
    const auto& t = std::get<TradeRecord>(out[0]);
    assert(t.symbol == "BTC");
    assert(t.trade_id == 12345);
    assert(near(t.price, 43250.10) && near(t.quantity, 0.005));
    assert(t.side == TradeSide::Sell);
    assert(t.exchange_ts_ms == 1700000000000);
    assert(t.recv_ts_ns > 0);

    out.clear();
    const std::string buy_msg =
        R"({"stream":"ethusdt@trade","data":{"s":"ETHUSDT","t":7,"p":"2250.5","q":"1.25","T":1,"m":false}})";
    assert(dec.decode(buy_msg, out) == DecodeStatus::Records);
    assert(std::get<TradeRecord>(out[0]).side == TradeSide::Buy);
    assert(std::get<TradeRecord>(out[0]).symbol == "ETH");

    // Partial depth: symbol comes from the stream name
    out.clear();
    const std::string depth_msg =
        R"({"stream":"ethusdt@depth20@100ms","data":{"lastUpdateId":160,)"
        R"("bids":[["2250.10","1.5"],["2250.00","3"]],"asks":[["2250.20","0.7"]]}})";
    assert(dec.decode(depth_msg, out) == DecodeStatus::Records);
    const auto& u = std::get<OrderBookUpdate>(out[0]);
    assert(u.symbol == "ETH");
    assert(u.sequence == 160);
    assert(u.bids.size() == 2 && u.asks.size() == 1);
    assert(near(u.bids[0].first, 2250.10) && near(u.bids[0].second, 1.5));
    assert(near(u.asks[0].first, 2250.20));

    // Subscription ack and unrelated streams carry no records
    out.clear();
    assert(dec.decode(R"({"result":null,"id":1})", out) == DecodeStatus::Control);
    assert(dec.decode(R"({"stream":"btcusdt@kline_1m","data":{"k":{}}})", out) == DecodeStatus::Control);
    assert(out.empty());

    // Malformed input
    assert(dec.decode("not json", out) == DecodeStatus::Malformed);
    assert(dec.decode(R"({"foo":1})", out) == DecodeStatus::Malformed);
    assert(dec.decode(R"({"stream":"btcusdt@trade","data":{"s":"BTCUSDT","p":"1"}})", out) ==
           DecodeStatus::Malformed);
    assert(dec.decode(R"({"stream":"btcusdt@trade","data":{"s":"BTCUSDT","t":1,"p":"abc","q":"1","T":1,"m":false}})",
                      out) == DecodeStatus::Malformed);
    assert(dec.decode(R"({"stream":"btcusdt@depth20@100ms","data":{"lastUpdateId":1,"bids":[["1"]],"asks":[]}})",
                      out) == DecodeStatus::Malformed);

    // REST snapshot body
    auto snap = dec.decode_snapshot(
        R"({"lastUpdateId":1027024,"bids":[["4.00000000","431.00000000"]],"asks":[["4.00000200","12.00000000"]]})",
        "BNB");
    assert(snap);
    assert(snap->symbol == "BNB" && snap->sequence == 1027024);
    assert(snap->bids.size() == 1 && near(snap->asks[0].first, 4.000002));
    assert(!dec.decode_snapshot(R"({"code":-1121,"msg":"Invalid symbol."})", "XXX"));

    std::cout << "OK\n";
    return 0;
}
