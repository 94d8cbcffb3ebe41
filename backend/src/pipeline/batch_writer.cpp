#include "batch_writer.hpp"
#include "util/backoff.hpp"

#include <stdexcept>

BatchWriter::BatchWriter(std::unique_ptr<IRecordStore> store, Options opts, ReportFn report)
    : store_(std::move(store))
    , opts_(opts)
    , report_(report ? std::move(report) : make_log_reporter("batch")) {
    if (!store_) throw std::invalid_argument("BatchWriter requires a record store");
    if (opts_.batch_size == 0) throw std::invalid_argument("batch_size must be positive");
    if (opts_.max_attempts < 1) opts_.max_attempts = 1;
    pending_.reserve(opts_.batch_size);
    flusher_ = std::thread([this] { flusher_loop(); });
}

BatchWriter::~BatchWriter() {
    close();
}

void BatchWriter::enqueue(MarketRecord rec) {
    bool sealed = false;
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_) throw std::logic_error("enqueue on a closed BatchWriter");
        pending_.push_back(std::move(rec));
        failed_flush_.reset();
        if (pending_.size() >= opts_.batch_size) {
            sealed_.push_back(std::move(pending_));
            pending_ = {};
            pending_.reserve(opts_.batch_size);
            sealed = true;
        }
    }
    if (sealed) cv_.notify_one();
}

BatchWriter::FlushStatus BatchWriter::flush() {
    std::lock_guard<std::mutex> io(io_m_);
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!pending_.empty()) {
            sealed_.push_back(std::move(pending_));
            pending_ = {};
        }
    }
    FlushStatus st;
    const bool ok = write_sealed(st);
    std::lock_guard<std::mutex> lk(m_);
    if (ok) {
        failed_flush_.reset();
    } else {
        st.unwritten = held_records();
        failed_flush_ = st.error;
    }
    return st;
}

bool BatchWriter::write_sealed(FlushStatus& st) {
    for (;;) {
        const std::vector<MarketRecord>* batch = nullptr;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (sealed_.empty()) return true;
            // deque keeps element addresses stable across push_back; only
            // this function (under io_m_) pops
            batch = &sealed_.front();
        }

        ExpBackoff delay(opts_.retry_delay, opts_.max_retry_delay);
        bool ok = false;
        for (int attempt = 1; attempt <= opts_.max_attempts; ++attempt) {
            ++st.attempts;
            {
                std::lock_guard<std::mutex> lk(m_);
                ++write_calls_;
            }
            try {
                store_->write_batch(*batch);
                ok = true;
                break;
            } catch (const std::exception& e) {
                st.error = e.what();
                {
                    std::lock_guard<std::mutex> lk(m_);
                    ++failed_attempts_;
                }
                if (attempt < opts_.max_attempts) std::this_thread::sleep_for(delay.next());
            }
        }
        if (!ok) {
            st.ok = false;
            return false;
        }

        const std::size_t n = batch->size();
        {
            std::lock_guard<std::mutex> lk(m_);
            sealed_.pop_front();
            written_ += n;
            ++batches_written_;
        }
        st.written += n;
    }
}

void BatchWriter::flusher_loop() {
    std::unique_lock<std::mutex> lk(m_);
    for (;;) {
        cv_.wait(lk, [this] { return stopping_ || !sealed_.empty(); });
        if (stopping_) return;
        lk.unlock();

        FlushStatus st;
        bool ok;
        {
            std::lock_guard<std::mutex> io(io_m_);
            ok = write_sealed(st);
        }

        lk.lock();
        if (!ok) {
            const std::size_t held = held_records();
            lk.unlock();
            report_(Severity::Warning,
                    "storage write failed after " + std::to_string(opts_.max_attempts) +
                    " attempts (" + st.error + "); " + std::to_string(held) +
                    " records kept for retry");
            lk.lock();
            cv_.wait_for(lk, opts_.retry_interval, [this] { return stopping_; });
            if (stopping_) return;
        }
    }
}

BatchWriter::FlushStatus BatchWriter::close() {
    std::lock_guard<std::mutex> cl(close_m_);
    if (close_result_) return *close_result_;

    {
        std::lock_guard<std::mutex> lk(m_);
        stopping_ = true;
        closed_ = true; // no producer may add after the final flush
    }
    cv_.notify_all();
    if (flusher_.joinable()) flusher_.join();

    FlushStatus st;
    std::optional<std::string> failed;
    {
        std::lock_guard<std::mutex> lk(m_);
        failed = failed_flush_;
        if (failed) {
            st.ok = false;
            st.error = *failed;
            st.unwritten = held_records();
        }
    }
    if (!failed) st = flush();
    if (!st.ok) {
        report_(Severity::Error,
                "final flush failed (" + st.error + "); " + std::to_string(st.unwritten) +
                " records were not persisted");
    }

    try {
        store_->close();
    } catch (const std::exception& e) {
        report_(Severity::Error, std::string("closing store failed: ") + e.what());
        st.ok = false;
        if (st.error.empty()) st.error = e.what();
    }

    close_result_ = st;
    return st;
}

BatchWriter::Stats BatchWriter::stats() const {
    std::lock_guard<std::mutex> lk(m_);
    Stats s;
    s.pending = pending_.size();
    for (const auto& b : sealed_) s.sealed += b.size();
    s.written = written_;
    s.batches_written = batches_written_;
    s.write_calls = write_calls_;
    s.failed_attempts = failed_attempts_;
    s.closed = closed_;
    return s;
}

std::size_t BatchWriter::held_records() const {
    std::size_t n = pending_.size();
    for (const auto& b : sealed_) n += b.size();
    return n;
}
