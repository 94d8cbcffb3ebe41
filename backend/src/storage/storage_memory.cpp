#include "storage_memory.hpp"

void MemoryRecordStore::write_batch(const std::vector<MarketRecord> &records)
{
    WriteHook hook;
    {
        std::scoped_lock lk(mtx_);
        ++attempts_;
        if (closed_)
            throw StorageError("memory store is closed");
        if (fail_next_ > 0)
        {
            --fail_next_;
            throw StorageError("injected write failure");
        }
        hook = hook_;
    }
    if (hook)
        hook(records);

    std::scoped_lock lk(mtx_);
    records_.insert(records_.end(), records.begin(), records.end());
    batches_.push_back(records.size());
}

void MemoryRecordStore::close()
{
    std::scoped_lock lk(mtx_);
    closed_ = true;
}

void MemoryRecordStore::fail_next(int n)
{
    std::scoped_lock lk(mtx_);
    fail_next_ = n;
}

void MemoryRecordStore::set_write_hook(WriteHook hook)
{
    std::scoped_lock lk(mtx_);
    hook_ = std::move(hook);
}

std::vector<MarketRecord> MemoryRecordStore::records() const
{
    std::scoped_lock lk(mtx_);
    return records_;
}

std::vector<std::size_t> MemoryRecordStore::batch_sizes() const
{
    std::scoped_lock lk(mtx_);
    return batches_;
}

std::size_t MemoryRecordStore::write_calls() const
{
    std::scoped_lock lk(mtx_);
    return attempts_;
}

bool MemoryRecordStore::closed() const
{
    std::scoped_lock lk(mtx_);
    return closed_;
}

std::unique_ptr<IRecordStore> make_memory_store() { return std::make_unique<MemoryRecordStore>(); }

std::unique_ptr<IRecordStore> make_record_store(const std::string &db_identifier)
{
    if (db_identifier == ":memory:")
        return make_memory_store();
    return make_postgres_store(db_identifier);
}
