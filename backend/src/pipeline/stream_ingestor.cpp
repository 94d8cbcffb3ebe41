#include "stream_ingestor.hpp"
#include "util/backoff.hpp"

#include <stdexcept>
#include <variant>

StreamIngestor::StreamIngestor(Options opts,
                               std::unique_ptr<IMarketWs> ws,
                               std::unique_ptr<IFeedDecoder> decoder,
                               std::unique_ptr<IBookSnapshotSource> snapshots,
                               MarketState& state,
                               BatchWriter& writer,
                               ReportFn report,
                               OnStateChange on_state)
    : opts_(std::move(opts))
    , ws_(std::move(ws))
    , decoder_(std::move(decoder))
    , snapshots_(std::move(snapshots))
    , state_store_(state)
    , writer_(writer)
    , report_(report ? std::move(report) : make_log_reporter("ingest"))
    , on_state_(std::move(on_state)) {
    if (!ws_ || !decoder_) throw std::invalid_argument("StreamIngestor requires a session and a decoder");
}

StreamIngestor::~StreamIngestor() {
    close();
}

void StreamIngestor::connect() {
    std::lock_guard<std::mutex> lk(thread_m_);
    if (closing_.load() || thread_.joinable()) return;
    thread_ = std::thread([this] { run_loop(); });
}

void StreamIngestor::reconnect() {
    if (closing_.load()) return;
    {
        std::lock_guard<std::mutex> lk(stats_m_);
        ++stats_.reconnect_requests;
    }
    {
        // close() under the lock so it can only hit a session opened before
        // this request, never the one the receive thread opens in answer
        std::lock_guard<std::mutex> lk(wait_m_);
        reconnect_gen_.fetch_add(1);
        if (session_live_) ws_->close();
    }
    wait_cv_.notify_all();
    connect(); // not started yet: start now
}

void StreamIngestor::close() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        if (closing_.exchange(true)) return;
    }
    set_state(ConnectionState::Closing);
    wait_cv_.notify_all();
    ws_->close();

    std::thread t;
    {
        std::lock_guard<std::mutex> lk(thread_m_);
        t = std::move(thread_);
    }
    if (t.joinable()) t.join();
    set_state(ConnectionState::Disconnected);
}

StreamIngestor::Stats StreamIngestor::stats() const {
    std::lock_guard<std::mutex> lk(stats_m_);
    return stats_;
}

void StreamIngestor::set_state(ConnectionState s) {
    const auto prev = state_.exchange(s, std::memory_order_acq_rel);
    if (prev != s && on_state_) on_state_(s);
}

bool StreamIngestor::wait_backoff(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(wait_m_);
    wait_cv_.wait_for(lk, d, [this] { return closing_.load() || reconnect_pending(); });
    return !closing_.load();
}

void StreamIngestor::begin_attempt() {
    std::lock_guard<std::mutex> lk(wait_m_);
    handled_gen_ = reconnect_gen_.load();
    session_live_ = true;
}

void StreamIngestor::end_attempt() {
    std::lock_guard<std::mutex> lk(wait_m_);
    session_live_ = false;
}

void StreamIngestor::run_loop() {
    ExpBackoff backoff(opts_.initial_backoff, opts_.max_backoff);

    while (!closing_.load()) {
        begin_attempt();
        set_state(ConnectionState::Connecting);
        try {
            ws_->open(opts_.streams);
        } catch (const std::exception& e) {
            end_attempt();
            if (closing_.load()) break;
            {
                std::lock_guard<std::mutex> lk(stats_m_);
                ++stats_.connect_failures;
            }
            set_state(ConnectionState::Disconnected);
            const auto d = reconnect_pending() ? std::chrono::milliseconds{0} : backoff.next();
            report_(Severity::Warning, std::string("connect failed: ") + e.what() +
                    "; retrying in " + std::to_string(d.count()) + " ms");
            if (!wait_backoff(d)) break;
            if (reconnect_pending()) backoff.reset();
            continue;
        }

        if (closing_.load()) {
            ws_->close();
            end_attempt();
            break;
        }
        set_state(ConnectionState::Connected);
        backoff.reset();
        {
            std::lock_guard<std::mutex> lk(stats_m_);
            ++stats_.connects;
        }
        report_(Severity::Success, "connected to feed (" + std::to_string(opts_.streams.size()) + " streams)");

        read_session();
        ws_->close();
        end_attempt();
        if (closing_.load()) break;
        set_state(ConnectionState::Disconnected);

        if (reconnect_pending()) {
            report_(Severity::Info, "reconnecting on request");
            backoff.reset();
            continue;
        }
        const auto d = backoff.next();
        report_(Severity::Warning, "connection lost; reconnecting in " + std::to_string(d.count()) + " ms");
        if (!wait_backoff(d)) break;
        if (reconnect_pending()) backoff.reset();
    }
}

void StreamIngestor::read_session() {
    std::string raw;
    try {
        while (!closing_.load() && !reconnect_pending()) {
            if (!ws_->read(raw)) return;
            if (closing_.load() || reconnect_pending()) return;
            handle_message(raw);
        }
    } catch (const std::exception& e) {
        if (!closing_.load() && !reconnect_pending())
            report_(Severity::Warning, std::string("feed read error: ") + e.what());
    }
}

void StreamIngestor::handle_message(const std::string& raw) {
    {
        std::lock_guard<std::mutex> lk(stats_m_);
        ++stats_.messages;
    }
    decoded_.clear();
    const DecodeStatus st = decoder_->decode(raw, decoded_);
    if (st == DecodeStatus::Control) return;
    if (st == DecodeStatus::Malformed) {
        std::lock_guard<std::mutex> lk(stats_m_);
        ++stats_.decode_errors;
        log_line("ingest", "skipping malformed frame (" + std::to_string(raw.size()) + " bytes)");
        return;
    }

    for (auto& rec : decoded_) {
        if (auto* t = std::get_if<TradeRecord>(&rec)) {
            if (!state_store_.record_trade(*t)) {
                {
                    std::lock_guard<std::mutex> lk(stats_m_);
                    ++stats_.unknown_symbols;
                }
                report_(Severity::Warning, "dropping trade for untracked symbol '" + t->symbol + "'");
                continue;
            }
            {
                std::lock_guard<std::mutex> lk(stats_m_);
                ++stats_.trades;
            }
            writer_.enqueue(std::move(rec));
            continue;
        }

        auto& u = std::get<OrderBookUpdate>(rec);
        switch (state_store_.replace_book(u)) {
            case BookApply::Applied: {
                {
                    std::lock_guard<std::mutex> lk(stats_m_);
                    ++stats_.books;
                }
                writer_.enqueue(std::move(rec));
                break;
            }
            case BookApply::Stale:
                resync(u.symbol);
                break;
            case BookApply::UnknownSymbol: {
                {
                    std::lock_guard<std::mutex> lk(stats_m_);
                    ++stats_.unknown_symbols;
                }
                report_(Severity::Warning, "dropping book for untracked symbol '" + u.symbol + "'");
                break;
            }
        }
    }
}

void StreamIngestor::resync(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lk(stats_m_);
        ++stats_.desyncs;
    }
    state_store_.reset_book(symbol);

    if (!snapshots_) {
        report_(Severity::Warning, "order book for " + symbol +
                " out of sequence; no snapshot source, continuing with live updates");
        return;
    }
    report_(Severity::Warning, "order book for " + symbol + " out of sequence; resynchronizing");

    auto snap = snapshots_->fetch(symbol);
    if (!snap) {
        report_(Severity::Warning, "snapshot for " + symbol + " unavailable; continuing with live updates");
        return;
    }
    snap->symbol = symbol;
    if (state_store_.replace_book(*snap) == BookApply::Applied) {
        {
            std::lock_guard<std::mutex> lk(stats_m_);
            ++stats_.books;
        }
        writer_.enqueue(MarketRecord{std::move(*snap)});
    }
}
