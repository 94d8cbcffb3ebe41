#include "pipeline/batch_writer.hpp"
#include "storage/storage_memory.hpp"

#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

static MarketRecord trade(std::uint64_t id) {
    TradeRecord t;
    t.symbol = "BTC";
    t.trade_id = id;
    t.price = 60000.0;
    t.quantity = 0.01;
    return t;
}

static BatchWriter::Options fast_opts(std::size_t batch) {
    BatchWriter::Options o;
    o.batch_size = batch;
    o.max_attempts = 3;
    o.retry_delay = std::chrono::milliseconds(1);
    o.max_retry_delay = std::chrono::milliseconds(4);
    o.retry_interval = std::chrono::milliseconds(20);
    return o;
}

static std::vector<std::uint64_t> ids(const std::vector<MarketRecord>& recs) {
    std::vector<std::uint64_t> out;
    for (const auto& r : recs) out.push_back(std::get<TradeRecord>(r).trade_id);
    return out;
}

static void threshold_batches() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(500));

    for (std::uint64_t i = 0; i < 1500; ++i) w.enqueue(trade(i));
    auto st = w.close();
    assert(st.ok);

    // three full batches, written in order, each record once
    assert((mem->batch_sizes() == std::vector<std::size_t>{500, 500, 500}));
    auto got = ids(mem->records());
    assert(got.size() == 1500);
    for (std::uint64_t i = 0; i < 1500; ++i) assert(got[i] == i);
    assert(mem->closed());
    assert(w.stats().written == 1500 && w.stats().batches_written == 3);
}

static void flush_is_idempotent() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(100));

    for (std::uint64_t i = 0; i < 10; ++i) w.enqueue(trade(i));
    auto first = w.flush();
    assert(first.ok && first.written == 10 && first.attempts == 1);
    const auto calls = mem->write_calls();

    auto second = w.flush();
    assert(second.ok && second.written == 0 && second.attempts == 0);
    assert(mem->write_calls() == calls);
    assert(w.stats().write_calls == calls);
    assert(w.stats().pending == 0 && w.stats().sealed == 0);
}

static void transient_failures_are_retried() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(100));

    for (std::uint64_t i = 0; i < 7; ++i) w.enqueue(trade(i));
    mem->fail_next(2);
    auto st = w.flush();
    assert(st.ok);
    assert(st.attempts == 3);
    assert(mem->write_calls() == 3);
    assert((mem->batch_sizes() == std::vector<std::size_t>{7}));
    assert((ids(mem->records()) == std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6}));
    assert(w.stats().failed_attempts == 2);
}

static void exhausted_retries_keep_the_batch() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(100));

    for (std::uint64_t i = 0; i < 4; ++i) w.enqueue(trade(i));
    mem->fail_next(1000);
    auto st = w.flush();
    assert(!st.ok);
    assert(st.unwritten == 4);
    assert(!st.error.empty());
    assert(mem->records().empty());
    assert(w.stats().sealed == 4);

    // records enqueued after the failure stay behind the retained batch
    w.enqueue(trade(4));
    mem->fail_next(0);
    auto retry = w.flush();
    assert(retry.ok);
    assert((ids(mem->records()) == std::vector<std::uint64_t>{0, 1, 2, 3, 4}));

    auto closed = w.close();
    assert(closed.ok && closed.written == 0);
    assert(mem->records().size() == 5);
}

static void close_after_failed_flush_skips_retries() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    std::vector<std::string> errors;
    BatchWriter w(std::move(store), fast_opts(100), [&](Severity sev, const std::string& msg) {
        if (sev == Severity::Error) errors.push_back(msg);
    });

    for (std::uint64_t i = 0; i < 4; ++i) w.enqueue(trade(i));
    mem->fail_next(1000);
    auto st = w.flush();
    assert(!st.ok && st.attempts == 3);
    const auto calls = mem->write_calls();

    // storage is still down: close must not spend another retry budget
    auto closed = w.close();
    assert(!closed.ok);
    assert(closed.unwritten == 4);
    assert(closed.attempts == 0);
    assert(closed.error == st.error);
    assert(mem->write_calls() == calls);
    assert(mem->closed());
    assert(errors.size() == 1);
}

static void close_retries_when_records_arrived_after_failure() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(100));

    w.enqueue(trade(1));
    mem->fail_next(1000);
    assert(!w.flush().ok);
    w.enqueue(trade(2));
    mem->fail_next(0);

    auto closed = w.close();
    assert(closed.ok && closed.written == 2);
    assert((ids(mem->records()) == std::vector<std::uint64_t>{1, 2}));
}

static void close_is_final() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    BatchWriter w(std::move(store), fast_opts(100));
    w.enqueue(trade(1));

    auto a = w.close();
    auto b = w.close();
    assert(a.ok && b.ok && a.written == 1 && b.written == 1);
    assert(mem->write_calls() == 1);
    assert(w.stats().closed);

    bool threw = false;
    try {
        w.enqueue(trade(2));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

static void background_retry_after_failure() {
    auto store = std::make_unique<MemoryRecordStore>();
    auto* mem = store.get();
    std::vector<std::string> warnings;
    std::mutex wm;
    BatchWriter w(std::move(store), fast_opts(2), [&](Severity sev, const std::string& msg) {
        std::lock_guard<std::mutex> lk(wm);
        if (sev == Severity::Warning) warnings.push_back(msg);
    });

    // first three attempts of the flusher fail; its opportunistic retry succeeds
    mem->fail_next(3);
    w.enqueue(trade(1));
    w.enqueue(trade(2));
    for (int i = 0; i < 200 && w.stats().written < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    assert(w.stats().written == 2);
    assert((ids(mem->records()) == std::vector<std::uint64_t>{1, 2}));
    std::lock_guard<std::mutex> lk(wm);
    assert(!warnings.empty());
}

int main() {
    threshold_batches();
    flush_is_idempotent();
    transient_failures_are_retried();
    exhausted_retries_keep_the_batch();
    close_after_failed_flush_skips_retries();
    close_retries_when_records_arrived_after_failure();
    close_is_final();
    background_retry_after_failure();
    std::cout << "OK\n";
    return 0;
}
