#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

inline constexpr const char* kAppVersion = "1.2.0";

// Both are preallocated per writer / per symbol at startup.
inline constexpr std::size_t kMaxBatchSize = 100000;
inline constexpr std::size_t kMaxTradeHistory = 100000;

// Startup configuration; read once in main and immutable afterwards.
struct AppConfig {
    std::string db_name = "crypto_data";            // ":memory:", conninfo, URI or database name
    std::vector<std::string> symbols = {"BTC", "ETH"};
    std::size_t batch_size = 100;
    bool enable_viz = false;
    unsigned short viz_port = 8050;
    std::string viz_address = "127.0.0.1";

    std::size_t trade_history = 1000;
    int book_depth = 20;                            // 5, 10 or 20 levels
    std::string quote = "USDT";
    std::string ws_host = "stream.binance.com";
    std::string ws_port = "9443";
    std::string rest_url = "https://api.binance.com";

    std::chrono::milliseconds reconnect_initial{1000};
    std::chrono::milliseconds reconnect_max{30000};
    int flush_attempts = 3;
    std::chrono::milliseconds flush_retry_delay{200};

    bool show_help = false;
    bool show_version = false;
};

// Load KEY=VALUE lines into the environment without overriding existing variables.
// Returns false if no file was found.
bool load_env_file(const std::string& filepath = ".env");

// Defaults <- CRYPTO_MONITOR_* environment <- command-line flags.
// Throws std::invalid_argument on malformed or out-of-range values.
AppConfig load_config(int argc, const char* const* argv);

std::string usage(const char* prog);
