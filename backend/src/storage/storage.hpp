#pragma once
#include "md/md_types.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Raised by IRecordStore implementations when a batch was not committed.
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IRecordStore
{
public:
    virtual ~IRecordStore() = default;

    // Durably writes all records or none; throws StorageError on failure.
    virtual void write_batch(const std::vector<MarketRecord> &records) = 0;

    // Releases the underlying connection. Further writes throw.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

std::unique_ptr<IRecordStore> make_memory_store();
std::unique_ptr<IRecordStore> make_postgres_store(const std::string &db_identifier);

// ":memory:" selects the in-process store, anything else PostgreSQL.
std::unique_ptr<IRecordStore> make_record_store(const std::string &db_identifier);
