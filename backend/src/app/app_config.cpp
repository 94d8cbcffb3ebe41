#include "app_config.hpp"
#include "md/symbol_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    auto end = s.find_last_not_of(" \t\r");
    if (end == std::string::npos) return {};
    s.erase(end + 1);
    return s;
}

std::size_t parse_size(const std::string& key, const std::string& v) {
    try {
        std::size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != v.size() || n <= 0) throw std::invalid_argument(v);
        return static_cast<std::size_t>(n);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + " expects a positive integer, got '" + v + "'");
    }
}

int parse_depth(const std::string& key, const std::string& v) {
    const auto n = parse_size(key, v);
    if (n > 20) throw std::invalid_argument("book depth must be 5, 10 or 20");
    return static_cast<int>(n);
}

bool parse_bool(const std::string& key, std::string v) {
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw std::invalid_argument(key + " expects a boolean, got '" + v + "'");
}

std::vector<std::string> split_symbols(const std::string& v) {
    std::vector<std::string> out;
    std::string tok;
    std::istringstream is(v);
    while (std::getline(is, tok, ',')) {
        std::istringstream ws(tok);
        for (std::string s; ws >> s;) out.push_back(s);
    }
    return out;
}

const char* env(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

void apply_env(AppConfig& cfg) {
    if (auto v = env("CRYPTO_MONITOR_DB")) cfg.db_name = v;
    if (auto v = env("CRYPTO_MONITOR_SYMBOLS")) cfg.symbols = split_symbols(v);
    if (auto v = env("CRYPTO_MONITOR_BATCH_SIZE")) cfg.batch_size = parse_size("CRYPTO_MONITOR_BATCH_SIZE", v);
    if (auto v = env("CRYPTO_MONITOR_VIZ")) cfg.enable_viz = parse_bool("CRYPTO_MONITOR_VIZ", v);
    if (auto v = env("CRYPTO_MONITOR_VIZ_PORT")) {
        auto p = parse_size("CRYPTO_MONITOR_VIZ_PORT", v);
        if (p > 65535) throw std::invalid_argument("CRYPTO_MONITOR_VIZ_PORT out of range");
        cfg.viz_port = static_cast<unsigned short>(p);
    }
    if (auto v = env("CRYPTO_MONITOR_HISTORY")) cfg.trade_history = parse_size("CRYPTO_MONITOR_HISTORY", v);
    if (auto v = env("CRYPTO_MONITOR_DEPTH")) cfg.book_depth = parse_depth("CRYPTO_MONITOR_DEPTH", v);
    if (auto v = env("CRYPTO_MONITOR_QUOTE")) cfg.quote = v;
    if (auto v = env("CRYPTO_MONITOR_WS_HOST")) cfg.ws_host = v;
    if (auto v = env("CRYPTO_MONITOR_WS_PORT")) cfg.ws_port = v;
    if (auto v = env("CRYPTO_MONITOR_REST_URL")) cfg.rest_url = v;
}

void validate(AppConfig& cfg) {
    std::vector<std::string> uniq;
    for (auto s : cfg.symbols) {
        s = SymbolCodec::normalize(trim(s));
        if (s.empty()) continue;
        if (std::find(uniq.begin(), uniq.end(), s) == uniq.end()) uniq.push_back(s);
    }
    if (uniq.empty()) throw std::invalid_argument("at least one symbol is required");
    cfg.symbols = std::move(uniq);
    cfg.quote = SymbolCodec::normalize(cfg.quote);

    if (cfg.db_name.empty()) throw std::invalid_argument("database identifier must not be empty");
    if (cfg.batch_size < 1 || cfg.batch_size > kMaxBatchSize)
        throw std::invalid_argument("batch size must be between 1 and " + std::to_string(kMaxBatchSize));
    if (cfg.trade_history < 1 || cfg.trade_history > kMaxTradeHistory)
        throw std::invalid_argument("trade history must be between 1 and " + std::to_string(kMaxTradeHistory));
    if (cfg.book_depth != 5 && cfg.book_depth != 10 && cfg.book_depth != 20)
        throw std::invalid_argument("book depth must be 5, 10 or 20");
}

} // namespace

bool load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return false; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
    return true;
}

AppConfig load_config(int argc, const char* const* argv) {
    AppConfig cfg;
    apply_env(cfg);

    auto need_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--db" || arg == "--db-name") {
            cfg.db_name = need_value(i, arg);
        } else if (arg == "--symbols") {
            // consumes values until the next flag
            std::vector<std::string> syms;
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                for (auto& s : split_symbols(argv[++i])) syms.push_back(s);
            }
            if (syms.empty()) throw std::invalid_argument("--symbols requires at least one symbol");
            cfg.symbols = std::move(syms);
        } else if (arg == "--batch-size") {
            cfg.batch_size = parse_size(arg, need_value(i, arg));
        } else if (arg == "--viz") {
            cfg.enable_viz = true;
        } else if (arg == "--viz-port") {
            auto p = parse_size(arg, need_value(i, arg));
            if (p > 65535) throw std::invalid_argument("--viz-port out of range");
            cfg.viz_port = static_cast<unsigned short>(p);
        } else if (arg == "--history") {
            cfg.trade_history = parse_size(arg, need_value(i, arg));
        } else if (arg == "--depth") {
            cfg.book_depth = parse_depth(arg, need_value(i, arg));
        } else if (arg == "--quote") {
            cfg.quote = need_value(i, arg);
        } else if (arg == "-h" || arg == "--help") {
            cfg.show_help = true;
        } else if (arg == "--version") {
            cfg.show_version = true;
        } else {
            throw std::invalid_argument("unknown argument '" + arg + "'");
        }
    }

    validate(cfg);
    return cfg;
}

std::string usage(const char* prog) {
    std::ostringstream os;
    os << "Usage: " << prog << " [options]\n"
       << "  --db NAME            database: name, postgresql:// URI, conninfo or :memory:\n"
       << "  --symbols SYM ...    tickers to track (default: BTC ETH)\n"
       << "  --batch-size N       records per database write (default: 100)\n"
       << "  --viz                serve the market view over HTTP\n"
       << "  --viz-port N         view port (default: 8050)\n"
       << "  --history N          recent trades kept per symbol (default: 1000)\n"
       << "  --depth N            order book levels: 5, 10 or 20 (default: 20)\n"
       << "  --quote ASSET        quote asset of the instruments (default: USDT)\n"
       << "  --version            print version and exit\n"
       << "  -h, --help           show this help\n"
       << "Settings may also come from CRYPTO_MONITOR_* variables or a .env file.\n";
    return os.str();
}
