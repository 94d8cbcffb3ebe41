#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "md/feed_decoder.hpp"
#include "md/market_state.hpp"
#include "md/md_types.hpp"
#include "pipeline/batch_writer.hpp"
#include "util/log.hpp"
#include "ws/ws.hpp"

// StreamIngestor owns the feed session and its receive thread:
//  - connect/read/decode loop; every accepted record goes to MarketState,
//    then to the BatchWriter, in decode order
//  - reconnect with exponential backoff on any session loss
//  - book resynchronization when a sequence regresses
// ConnectionState is written only by this class.
class StreamIngestor {
public:
    struct Options {
        std::vector<std::string> streams; // venue stream names to subscribe
        std::chrono::milliseconds initial_backoff{1000};
        std::chrono::milliseconds max_backoff{30000};
    };

    struct Stats {
        std::uint64_t messages{0};
        std::uint64_t trades{0};
        std::uint64_t books{0};
        std::uint64_t decode_errors{0};
        std::uint64_t desyncs{0};
        std::uint64_t unknown_symbols{0};
        std::uint64_t connects{0};
        std::uint64_t connect_failures{0};
        std::uint64_t reconnect_requests{0};
    };

    using OnStateChange = std::function<void(ConnectionState)>;

    // snapshots may be null: resync then continues with live updates only.
    StreamIngestor(Options opts,
                   std::unique_ptr<IMarketWs> ws,
                   std::unique_ptr<IFeedDecoder> decoder,
                   std::unique_ptr<IBookSnapshotSource> snapshots,
                   MarketState& state,
                   BatchWriter& writer,
                   ReportFn report = {},
                   OnStateChange on_state = {});
    ~StreamIngestor();

    StreamIngestor(const StreamIngestor&) = delete;
    StreamIngestor& operator=(const StreamIngestor&) = delete;

    // Starts the receive thread (no-op if running or closed).
    void connect();

    // Drops the current session (or cuts a backoff wait) and connects again now.
    void reconnect();

    // Terminal: Closing, stop the session and the thread, then Disconnected.
    void close();

    ConnectionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    Stats stats() const;

private:
    void run_loop();
    // Reads until the session ends; false once close() or reconnect() cut it.
    void read_session();
    void handle_message(const std::string& raw);
    void resync(const std::string& symbol);
    // Waits d or until close()/reconnect(); false if closing.
    bool wait_backoff(std::chrono::milliseconds d);
    // Receive thread only: a reconnect() arrived after the current attempt began.
    bool reconnect_pending() const { return reconnect_gen_.load() != handled_gen_; }
    void begin_attempt();
    void end_attempt();
    void set_state(ConnectionState s);

    Options opts_;
    std::unique_ptr<IMarketWs> ws_;
    std::unique_ptr<IFeedDecoder> decoder_;
    std::unique_ptr<IBookSnapshotSource> snapshots_;
    MarketState& state_store_;
    BatchWriter& writer_;
    ReportFn report_;
    OnStateChange on_state_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> closing_{false};

    // reconnect() bumps reconnect_gen_; each attempt records the value it
    // started from. session_live_ (under wait_m_) tells reconnect() whether
    // there is a session of an older generation to cut.
    std::mutex wait_m_;
    std::condition_variable wait_cv_;
    std::atomic<std::uint64_t> reconnect_gen_{0};
    std::uint64_t handled_gen_{0};
    bool session_live_{false};

    std::mutex thread_m_;
    std::thread thread_;

    std::vector<MarketRecord> decoded_; // receive-thread scratch

    mutable std::mutex stats_m_;
    Stats stats_;
};
