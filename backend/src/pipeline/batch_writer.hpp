#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "md/md_types.hpp"
#include "storage/storage.hpp"
#include "util/log.hpp"

// BatchWriter is the only write path to the record store.
// - enqueue() appends to the pending batch; a batch that reaches batch_size
//   is sealed and written by the background flusher thread.
// - flush() writes everything pending on the caller's thread.
// - A batch leaves memory only after the store committed it; failed writes
//   keep it queued and are retried, never dropped.
class BatchWriter {
public:
    struct Options {
        std::size_t batch_size{100};
        int max_attempts{3};                                // per batch, per flush
        std::chrono::milliseconds retry_delay{100};         // first delay between attempts
        std::chrono::milliseconds max_retry_delay{1000};
        std::chrono::milliseconds retry_interval{5000};     // background re-try after exhaustion
    };

    struct FlushStatus {
        bool ok{true};
        std::size_t written{0};   // records committed by this call
        std::size_t unwritten{0}; // records still held after a failure
        int attempts{0};          // store writes attempted
        std::string error;
    };

    struct Stats {
        std::size_t pending{0};
        std::size_t sealed{0};          // records in sealed, unwritten batches
        std::size_t written{0};         // records committed
        std::size_t batches_written{0};
        std::size_t write_calls{0};     // store writes attempted
        std::size_t failed_attempts{0};
        bool closed{false};
    };

    BatchWriter(std::unique_ptr<IRecordStore> store, Options opts, ReportFn report = {});
    ~BatchWriter();

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    // Throws std::logic_error after close().
    void enqueue(MarketRecord rec);

    FlushStatus flush();

    // Final flush, then releases the store. Later calls return the first result.
    // If the last flush() failed and nothing was enqueued since, the final
    // flush is not retried: the records are reported as not persisted.
    FlushStatus close();

    Stats stats() const;
    const Options& options() const noexcept { return opts_; }
    std::string store_name() const { return store_->describe(); }

private:
    void flusher_loop();
    // Writes sealed batches in order until empty or one exhausts its attempts.
    // Caller holds io_m_.
    bool write_sealed(FlushStatus& st);
    std::size_t held_records() const; // caller holds m_

    std::unique_ptr<IRecordStore> store_;
    Options opts_;
    ReportFn report_;

    mutable std::mutex m_; // pending_, sealed_, counters, flags
    std::condition_variable cv_;
    std::vector<MarketRecord> pending_;
    std::deque<std::vector<MarketRecord>> sealed_;
    std::size_t written_{0};
    std::size_t batches_written_{0};
    std::size_t write_calls_{0};
    std::size_t failed_attempts_{0};
    bool stopping_{false};
    bool closed_{false};
    std::optional<std::string> failed_flush_; // error of the last flush() if it failed

    std::mutex io_m_; // serializes store writes between flusher and flush()

    std::mutex close_m_;
    std::optional<FlushStatus> close_result_;

    std::thread flusher_;
};
