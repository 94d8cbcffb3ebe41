#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <curl/curl.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "app/app_config.hpp"
#include "app/console_io.hpp"
#include "app/lifecycle.hpp"
#include "app/shutdown_signals.hpp"
#include "md/symbol_codec.hpp"
#include "server/http_view.hpp"
#include "storage/storage.hpp"
#include "venues/binance/parser.hpp"
#include "venues/binance/rest.hpp"
#include "ws/ws.hpp"

namespace {

std::vector<std::string> binance_streams(const AppConfig& cfg) {
    std::vector<std::string> streams;
    for (const auto& sym : cfg.symbols) {
        const auto s = SymbolCodec::to_stream(sym, cfg.quote);
        streams.push_back(s + "@trade");
        streams.push_back(s + "@depth" + std::to_string(cfg.book_depth) + "@100ms");
    }
    return streams;
}

} // namespace

int main(int argc, char** argv) {
    load_env_file();

    AppConfig cfg;
    try {
        cfg = load_config(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    if (cfg.show_version) {
        std::cout << "crypto-monitor " << kAppVersion << std::endl;
        return 0;
    }

    ConsoleIO console;

    std::unique_ptr<IRecordStore> store;
    try {
        store = make_record_store(cfg.db_name);
    } catch (const StorageError& e) {
        console.report(std::string("Failed to open database: ") + e.what(), Severity::Error, true);
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    MonitorOptions opts;
    opts.version = kAppVersion;
    opts.db_label = store->describe();
    opts.symbols = cfg.symbols;
    opts.history_capacity = cfg.trade_history;
    opts.writer.batch_size = cfg.batch_size;
    opts.writer.max_attempts = cfg.flush_attempts;
    opts.writer.retry_delay = cfg.flush_retry_delay;
    opts.ingestor.streams = binance_streams(cfg);
    opts.ingestor.initial_backoff = cfg.reconnect_initial;
    opts.ingestor.max_backoff = cfg.reconnect_max;
    opts.enable_viz = cfg.enable_viz;
    opts.viz_url = "http://" + cfg.viz_address + ":" + std::to_string(cfg.viz_port);

    MonitorDeps deps;
    deps.ws = std::make_unique<BinanceWs>(cfg.ws_host, cfg.ws_port);
    deps.decoder = std::make_unique<BinanceDecoder>(cfg.quote);
    deps.snapshots = std::make_unique<BinanceRest>(cfg.rest_url, cfg.quote, cfg.book_depth);
    deps.store = std::move(store);
    deps.io = &console;
    deps.make_view = [&cfg](const MarketState& state, const StreamIngestor& ingestor, const BatchWriter& writer) {
        return std::make_unique<HttpMarketView>(ViewContext{state, &ingestor, &writer},
                                                cfg.viz_address, cfg.viz_port);
    };

    std::unique_ptr<LifecycleCoordinator> app;
    try {
        app = std::make_unique<LifecycleCoordinator>(std::move(opts), std::move(deps));
    } catch (const std::exception& e) {
        console.report(std::string("Failed to start: ") + e.what(), Severity::Error, true);
        curl_global_cleanup();
        return 1;
    }

    int rc = 0;
    {
        // SIGINT/SIGTERM only request shutdown; teardown runs on this thread.
        boost::asio::io_context sig_ioc{1};
        boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
        watch_shutdown_signals(signals, [&app](int) { app->request_shutdown(); });
        std::thread sig_thread([&sig_ioc] { sig_ioc.run(); });

        app->start();
        app->wait_for_shutdown();
        app->shutdown();

        sig_ioc.stop();
        sig_thread.join();
        if (!app->clean_shutdown()) rc = 1;
    }
    app.reset();

    curl_global_cleanup();
    return rc;
}
