#pragma once
#include "storage.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

// In-process record store. Used for dry runs (":memory:") and by tests,
// which can inject write failures.
class MemoryRecordStore final : public IRecordStore
{
public:
    // Called before each write attempt; throwing from it fails the attempt.
    using WriteHook = std::function<void(const std::vector<MarketRecord> &)>;

    void write_batch(const std::vector<MarketRecord> &records) override;
    void close() override;
    std::string describe() const override { return "memory"; }

    // Fail the next n write attempts with StorageError.
    void fail_next(int n);
    void set_write_hook(WriteHook hook);

    std::vector<MarketRecord> records() const;
    std::vector<std::size_t> batch_sizes() const; // committed batches only
    std::size_t write_calls() const;              // attempts, including failed ones
    bool closed() const;

private:
    mutable std::mutex mtx_;
    std::vector<MarketRecord> records_;
    std::vector<std::size_t> batches_;
    std::size_t attempts_{0};
    int fail_next_{0};
    bool closed_{false};
    WriteHook hook_;
};
