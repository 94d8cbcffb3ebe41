#include "rest.hpp"
#include "parser.hpp"
#include "md/symbol_codec.hpp"
#include "util/log.hpp"

#include <curl/curl.h>
#include <string>

// Helper for CURL write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append(static_cast<char*>(contents), new_length);
    return new_length;
}

BinanceRest::BinanceRest(std::string base_url, std::string quote, int depth, long timeout_ms)
    : base_url_(std::move(base_url))
    , quote_(std::move(quote))
    , depth_(depth)
    , timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

bool BinanceRest::http_get(const std::string& url, std::string& body, std::string& err) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        err = "curl_easy_init failed";
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "User-Agent: crypto-monitor/1.0");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    bool ok = false;
    if (res != CURLE_OK) {
        err = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        ok = status >= 200 && status < 300;
        if (!ok) err = "HTTP " + std::to_string(status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return ok;
}

std::optional<OrderBookUpdate> BinanceRest::fetch(const std::string& symbol) {
    const std::string url = base_url_ + "/api/v3/depth?symbol=" +
        SymbolCodec::to_instrument(symbol, quote_) + "&limit=" + std::to_string(depth_);

    std::string body, err;
    if (!http_get(url, body, err)) {
        log_line("binance-rest", "depth snapshot for " + symbol + " failed: " + err);
        return std::nullopt;
    }

    BinanceDecoder decoder(quote_);
    auto snap = decoder.decode_snapshot(body, symbol);
    if (!snap) log_line("binance-rest", "unparseable depth snapshot for " + symbol);
    return snap;
}
