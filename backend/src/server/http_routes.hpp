#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>

#include "md/market_state.hpp"
#include "md/symbol_codec.hpp"
#include "pipeline/batch_writer.hpp"
#include "pipeline/stream_ingestor.hpp"
#include "util/json_encode.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

// Maximum book depth and trade count served per request
constexpr std::size_t MAX_VIEW_DEPTH = 50;
constexpr std::size_t MAX_VIEW_TRADES = 500;

// What the read-only views may look at.
struct ViewContext {
    const MarketState& state;
    const StreamIngestor* ingestor{nullptr};
    const BatchWriter* writer{nullptr};
};

inline void json_reply(http::response<http::string_body>& res, http::status st, std::string body) {
    res.result(st);
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
}

inline std::size_t query_size(const urls::url_view& url, std::string_view key,
                              std::size_t fallback, std::size_t max) {
    for (auto const& p : url.params()) {
        if (p.key != key) continue;
        try {
            std::size_t v = std::stoul(std::string(p.value));
            if (v > 0) return std::min(v, max);
        } catch (const std::exception&) {
            // keep the fallback for non-numeric input
        }
    }
    return fallback;
}

inline std::string query_symbol(const urls::url_view& url) {
    for (auto const& p : url.params()) {
        if (p.key == "symbol") return SymbolCodec::normalize(std::string(p.value));
    }
    return {};
}

inline void handle_request(const ViewContext& ctx,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "crypto-monitor/1.0");

    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        json_reply(res, http::status::bad_request, R"({"error":"bad request"})");
        return;
    }
    urls::url_view url = *parsed_result;

    if (req.method() != http::verb::get) {
        json_reply(res, http::status::method_not_allowed, R"({"error":"method not allowed"})");
        return;
    }

    // /api/health
    if (url.path() == "/api/health") {
        json_reply(res, http::status::ok, R"({"status":"ok"})");
        return;
    }

    // /api/symbols
    if (url.path() == "/api/symbols") {
        std::ostringstream os;
        os << "[";
        bool first = true;
        for (const auto& s : ctx.state.symbols()) {
            if (!first) os << ",";
            first = false;
            os << "\"" << json_escape(s) << "\"";
        }
        os << "]";
        json_reply(res, http::status::ok, os.str());
        return;
    }

    // /api/status
    if (url.path() == "/api/status") {
        std::ostringstream os;
        os << "{";
        if (ctx.ingestor) {
            const auto st = ctx.ingestor->stats();
            os << "\"connection\":\"" << to_cstr(ctx.ingestor->state()) << "\","
               << "\"messages\":" << st.messages << ","
               << "\"decode_errors\":" << st.decode_errors << ","
               << "\"desyncs\":" << st.desyncs << ",";
        }
        if (ctx.writer) {
            const auto ws = ctx.writer->stats();
            os << "\"pending\":" << (ws.pending + ws.sealed) << ","
               << "\"written\":" << ws.written << ",";
        }
        os << "\"symbols\":[";
        bool first = true;
        for (const auto& s : ctx.state.summary()) {
            if (!first) os << ",";
            first = false;
            os << "{\"symbol\":\"" << json_escape(s.symbol) << "\","
               << "\"trades\":" << s.trades << ","
               << "\"sequence\":" << s.sequence << ","
               << "\"has_book\":" << (s.has_book ? "true" : "false") << "}";
        }
        os << "]}";
        json_reply(res, http::status::ok, os.str());
        return;
    }

    // /api/book?symbol=BTC&depth=10, /api/trades?symbol=BTC&limit=100
    const bool is_book = url.path() == "/api/book";
    const bool is_trades = url.path() == "/api/trades";
    if (is_book || is_trades) {
        const std::string symbol = query_symbol(url);
        auto snap = ctx.state.snapshot(symbol);
        if (!snap) {
            json_reply(res, http::status::not_found, R"({"error":"unknown symbol"})");
            return;
        }

        std::ostringstream os;
        os << "{\"symbol\":\"" << json_escape(snap->symbol) << "\",";
        if (is_book) {
            const std::size_t depth = query_size(url, "depth", MAX_VIEW_DEPTH, MAX_VIEW_DEPTH);
            if (snap->book) {
                auto& b = *snap->book;
                if (b.bids.size() > depth) b.bids.resize(depth);
                if (b.asks.size() > depth) b.asks.resize(depth);
                os << "\"sequence\":" << b.sequence << ","
                   << "\"ts_ns\":" << b.ts_ns << ",";
                os << "\"bids\":"; json_level_array(os, b.bids); os << ",";
                os << "\"asks\":"; json_level_array(os, b.asks);
            } else {
                os << "\"sequence\":null,\"bids\":[],\"asks\":[]";
            }
        } else {
            const std::size_t limit = query_size(url, "limit", 100, MAX_VIEW_TRADES);
            const auto& tr = snap->trades;
            const std::size_t from = tr.size() > limit ? tr.size() - limit : 0;
            os << "\"trades\":[";
            for (std::size_t i = from; i < tr.size(); ++i) {
                if (i != from) os << ",";
                json_trade(os, tr[i]);
            }
            os << "]";
        }
        os << "}";
        json_reply(res, http::status::ok, os.str());
        return;
    }

    // 404
    json_reply(res, http::status::not_found, R"({"error":"not found"})");
}
