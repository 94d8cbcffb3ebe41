#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <sstream>
#include <iomanip>

#include "md/md_types.hpp"

// Basic JSON string escaper
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

// Encode levels as [[price, qty], ...] (the venue's own layout)
inline void json_level_array(std::ostringstream& os, const std::vector<PriceLevel>& rows) {
    os << "[";
    bool first = true;
    for (const auto& [px, sz] : rows) {
        if (!first) os << ",";
        first = false;
        os << "[" << std::setprecision(15) << px << "," << std::setprecision(15) << sz << "]";
    }
    os << "]";
}

inline std::string json_level_array(const std::vector<PriceLevel>& rows) {
    std::ostringstream os;
    json_level_array(os, rows);
    return os.str();
}

inline void json_trade(std::ostringstream& os, const TradeRecord& t) {
    os << "{"
       << "\"id\":" << t.trade_id << ","
       << "\"price\":" << std::setprecision(15) << t.price << ","
       << "\"qty\":" << std::setprecision(15) << t.quantity << ","
       << "\"side\":\"" << to_cstr(t.side) << "\","
       << "\"ts_ms\":" << t.exchange_ts_ms
       << "}";
}
