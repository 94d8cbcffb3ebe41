#pragma once
#include "md/feed_decoder.hpp"
#include "md/md_types.hpp"
#include "md/symbol_codec.hpp"

#include <simdjson.h>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Decodes Binance combined-stream frames:
//   {"stream":"btcusdt@trade","data":{"e":"trade","s":"BTCUSDT","t":1,"p":"1.0","q":"2.0","T":...,"m":true}}
//   {"stream":"btcusdt@depth20@100ms","data":{"lastUpdateId":160,"bids":[["p","q"],...],"asks":[...]}}
// Subscription acks ({"result":null,"id":1}) decode as Control.
class BinanceDecoder : public IFeedDecoder {
public:
    explicit BinanceDecoder(std::string quote = "USDT") : quote_(std::move(quote)) {}

    DecodeStatus decode(const std::string& raw, std::vector<MarketRecord>& out) override {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) return DecodeStatus::Malformed;

        simdjson::ondemand::object root;
        if (doc.get_object().get(root)) return DecodeStatus::Malformed;

        std::string_view stream_sv;
        if (root.find_field_unordered("stream").get(stream_sv)) {
            // Not a market frame; acks carry an "id"
            simdjson::ondemand::value id;
            if (!root.find_field_unordered("id").get(id)) return DecodeStatus::Control;
            return DecodeStatus::Malformed;
        }
        const std::string stream(stream_sv);

        simdjson::ondemand::object data;
        if (root.find_field_unordered("data").get_object().get(data)) return DecodeStatus::Malformed;

        const auto at = stream.find('@');
        if (at == std::string::npos || at == 0) return DecodeStatus::Malformed;
        const std::string_view kind = std::string_view(stream).substr(at + 1);

        if (kind == "trade") return decode_trade(data, out);
        if (kind.rfind("depth", 0) == 0) {
            return decode_depth(data, SymbolCodec::to_canonical(stream.substr(0, at), quote_), out);
        }
        return DecodeStatus::Control;
    }

    // REST /api/v3/depth body: {"lastUpdateId":1027024,"bids":[...],"asks":[...]}
    std::optional<OrderBookUpdate> decode_snapshot(const std::string& raw, const std::string& symbol) {
        simdjson::padded_string pj(raw);
        simdjson::ondemand::document doc;
        if (parser_.iterate(pj).get(doc)) return std::nullopt;
        simdjson::ondemand::object root;
        if (doc.get_object().get(root)) return std::nullopt;
        std::vector<MarketRecord> out;
        if (decode_depth(root, symbol, out) != DecodeStatus::Records) return std::nullopt;
        return std::get<OrderBookUpdate>(std::move(out.front()));
    }

private:
    DecodeStatus decode_trade(simdjson::ondemand::object& data, std::vector<MarketRecord>& out) {
        std::string_view sym_sv, px_sv, qty_sv;
        std::uint64_t trade_id = 0;
        std::int64_t trade_ts = 0;
        bool buyer_is_maker = false;
        if (data.find_field_unordered("s").get(sym_sv)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("t").get(trade_id)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("p").get(px_sv)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("q").get(qty_sv)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("T").get(trade_ts)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("m").get(buyer_is_maker)) return DecodeStatus::Malformed;

        TradeRecord t;
        t.symbol = SymbolCodec::to_canonical(std::string(sym_sv), quote_);
        if (!parse_num(px_sv, t.price) || !parse_num(qty_sv, t.quantity)) return DecodeStatus::Malformed;
        // buyer as maker means the seller crossed the spread
        t.side = buyer_is_maker ? TradeSide::Sell : TradeSide::Buy;
        t.trade_id = trade_id;
        t.exchange_ts_ms = trade_ts;
        t.recv_ts_ns = wall_ns();
        out.emplace_back(std::move(t));
        return DecodeStatus::Records;
    }

    DecodeStatus decode_depth(simdjson::ondemand::object& data, std::string symbol,
                              std::vector<MarketRecord>& out) {
        OrderBookUpdate u;
        u.symbol = std::move(symbol);
        u.ts_ns = wall_ns();
        if (data.find_field_unordered("lastUpdateId").get(u.sequence)) return DecodeStatus::Malformed;

        simdjson::ondemand::array bids, asks;
        if (data.find_field_unordered("bids").get(bids)) return DecodeStatus::Malformed;
        if (!read_levels(bids, u.bids)) return DecodeStatus::Malformed;
        if (data.find_field_unordered("asks").get(asks)) return DecodeStatus::Malformed;
        if (!read_levels(asks, u.asks)) return DecodeStatus::Malformed;

        out.emplace_back(std::move(u));
        return DecodeStatus::Records;
    }

    // [["price","qty"], ...]
    static bool read_levels(simdjson::ondemand::array& arr, std::vector<PriceLevel>& out) {
        for (auto lvl_val : arr) {
            simdjson::ondemand::array lvl;
            if (lvl_val.get_array().get(lvl)) return false;
            std::string_view px_sv, qty_sv;
            std::size_t n = 0;
            for (auto field : lvl) {
                std::string_view sv;
                if (field.get(sv)) return false;
                if (n == 0) px_sv = sv;
                else if (n == 1) qty_sv = sv;
                ++n;
            }
            if (n < 2) return false;
            double px = 0, qty = 0;
            if (!parse_num(px_sv, px) || !parse_num(qty_sv, qty)) return false;
            out.emplace_back(px, qty);
        }
        return true;
    }

    static bool parse_num(std::string_view sv, double& v) {
        // avoids locale pitfalls of stream extraction
        std::string tmp(sv);
        char* end = nullptr;
        v = std::strtod(tmp.c_str(), &end);
        return end != tmp.c_str() && *end == '\0';
    }

    static std::int64_t wall_ns() {
        using namespace std::chrono;
        return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string quote_;
    simdjson::ondemand::parser parser_;
};
