#include "storage_postgres.hpp"
#include "util/json_encode.hpp"
#include "util/log.hpp"

#include <fstream>
#include <sstream>
#include <variant>

#ifndef CRYPTO_MONITOR_SCHEMA_FILE
#define CRYPTO_MONITOR_SCHEMA_FILE "backend/src/storage/schema/build_tables.sql"
#endif

namespace {

const char* kInsertTrade = R"(
    INSERT INTO trades (symbol, trade_id, price, quantity, side, exchange_ts_ms, recv_ts_ns)
    VALUES ($1, $2, $3, $4, $5, $6, $7)
)";

const char* kInsertBook = R"(
    INSERT INTO order_book_updates (symbol, sequence, bids, asks, ts_ns)
    VALUES ($1, $2, $3::jsonb, $4::jsonb, $5)
)";

} // namespace

std::string PostgresRecordStore::to_conninfo(const std::string& id) {
    std::string conn;
    if (id.rfind("postgresql://", 0) == 0 || id.rfind("postgres://", 0) == 0 ||
        id.find('=') != std::string::npos) {
        conn = id;
    } else {
        conn = "dbname=" + id;
    }
    // Add connection timeout to connection string if not present
    if (conn.find("connect_timeout") == std::string::npos) {
        if (conn.rfind("postgres", 0) == 0 && conn.find("://") != std::string::npos) {
            conn += (conn.find('?') != std::string::npos) ? "&connect_timeout=10" : "?connect_timeout=10";
        } else {
            conn += " connect_timeout=10";
        }
    }
    return conn;
}

PostgresRecordStore::PostgresRecordStore(const std::string& db_identifier)
    : db_id_(db_identifier), conn_str_(to_conninfo(db_identifier)) {
    // Fail fast on an unreachable database and create tables up front
    try {
        ensure_schema(connection());
    } catch (const std::exception& e) {
        throw StorageError("cannot open database '" + db_id_ + "': " + e.what());
    }
}

pqxx::connection& PostgresRecordStore::connection() {
    if (!conn_ || !conn_->is_open()) {
        conn_ = std::make_unique<pqxx::connection>(conn_str_);
    }
    return *conn_;
}

void PostgresRecordStore::write_batch(const std::vector<MarketRecord>& records) {
    if (closed_) throw StorageError("postgres store is closed");
    if (records.empty()) return;

    try {
        pqxx::work txn(connection());
        for (const auto& rec : records) {
            if (const auto* t = std::get_if<TradeRecord>(&rec)) {
                txn.exec(kInsertTrade,
                         pqxx::params(t->symbol,
                                      static_cast<std::int64_t>(t->trade_id),
                                      t->price,
                                      t->quantity,
                                      std::string(to_cstr(t->side)),
                                      t->exchange_ts_ms,
                                      t->recv_ts_ns));
            } else {
                const auto& u = std::get<OrderBookUpdate>(rec);
                txn.exec(kInsertBook,
                         pqxx::params(u.symbol,
                                      static_cast<std::int64_t>(u.sequence),
                                      json_level_array(u.bids),
                                      json_level_array(u.asks),
                                      u.ts_ns));
            }
        }
        txn.commit();
    } catch (const pqxx::broken_connection& e) {
        conn_.reset(); // reopen on the next attempt
        throw StorageError(std::string("connection lost: ") + e.what());
    } catch (const std::exception& e) {
        throw StorageError(std::string("batch insert failed: ") + e.what());
    }
}

void PostgresRecordStore::close() {
    if (closed_) return;
    closed_ = true;
    if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

std::string PostgresRecordStore::describe() const {
    return "postgres:" + db_id_;
}

std::string PostgresRecordStore::read_sql_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open SQL file: " + filepath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void PostgresRecordStore::ensure_schema(pqxx::connection& conn) {
    std::string sql;
    try {
        sql = read_sql_file("src/storage/schema/build_tables.sql");
    } catch (const std::exception&) {
        sql = read_sql_file(CRYPTO_MONITOR_SCHEMA_FILE);
    }

    // Use nontransaction for DDL statements (CREATE TABLE, etc.)
    pqxx::nontransaction ntxn(conn);

    // Split SQL by semicolon and execute each statement
    std::istringstream stream(sql);
    std::string statement;
    std::string line;
    while (std::getline(stream, line)) {
        // Skip comment-only lines
        std::string trimmed = line;
        trimmed.erase(0, trimmed.find_first_not_of(" \t"));
        if (trimmed.empty() || trimmed.find("--") == 0) {
            continue;
        }
        statement += line + "\n";
        if (line.find(';') == std::string::npos) continue;

        try {
            auto result = ntxn.exec(statement);
            (void)result;
        } catch (const pqxx::sql_error& e) {
            std::string err_msg = e.what();
            if (err_msg.find("already exists") == std::string::npos) {
                throw;
            }
        }
        statement.clear();
    }
    log_line("pg-store", "schema ready on " + db_id_);
}

std::unique_ptr<IRecordStore> make_postgres_store(const std::string& db_identifier) {
    return std::make_unique<PostgresRecordStore>(db_identifier);
}
