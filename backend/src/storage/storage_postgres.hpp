#pragma once
#include "storage.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

// PostgreSQL-backed record store via libpqxx.
// One connection, reopened lazily after a broken connection; each batch is
// one transaction.
class PostgresRecordStore final : public IRecordStore {
public:
    // Accepts a "postgresql://" URI, a key=value conninfo, or a bare database name.
    explicit PostgresRecordStore(const std::string& db_identifier);

    void write_batch(const std::vector<MarketRecord>& records) override;
    void close() override;
    std::string describe() const override;

    static std::string to_conninfo(const std::string& db_identifier);

private:
    pqxx::connection& connection();
    void ensure_schema(pqxx::connection& conn);
    static std::string read_sql_file(const std::string& filepath);

    std::string db_id_;
    std::string conn_str_;
    std::unique_ptr<pqxx::connection> conn_;
    bool closed_{false};
};
