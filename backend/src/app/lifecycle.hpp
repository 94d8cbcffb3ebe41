#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/command_io.hpp"
#include "app/command_service.hpp"
#include "md/feed_decoder.hpp"
#include "md/market_state.hpp"
#include "pipeline/batch_writer.hpp"
#include "pipeline/stream_ingestor.hpp"
#include "storage/storage.hpp"
#include "ws/ws.hpp"

struct MonitorOptions {
    std::string version;
    std::string db_label;                 // shown in the banner
    std::vector<std::string> symbols;
    std::size_t history_capacity{1000};
    BatchWriter::Options writer;
    StreamIngestor::Options ingestor;     // streams filled by the caller
    bool enable_viz{false};
    std::string viz_url;                  // shown once the view is up
};

// Everything the coordinator does not build itself. io must outlive the coordinator.
struct MonitorDeps {
    using ViewFactory = std::function<std::unique_ptr<IMarketView>(
        const MarketState&, const StreamIngestor&, const BatchWriter&)>;

    std::unique_ptr<IMarketWs> ws;
    std::unique_ptr<IFeedDecoder> decoder;
    std::unique_ptr<IBookSnapshotSource> snapshots; // optional
    std::unique_ptr<IRecordStore> store;
    ICommandIO* io{nullptr};
    ViewFactory make_view;                          // optional
};

// Owns and wires the components; runs the ordered teardown exactly once.
class LifecycleCoordinator {
public:
    // Throws std::invalid_argument when a required collaborator is missing.
    LifecycleCoordinator(MonitorOptions opts, MonitorDeps deps);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    void start();

    // Any thread, any number of times.
    void request_shutdown();
    void wait_for_shutdown();
    bool shutdown_requested() const;

    // Teardown: commands, ingestor, view, writer. Returns false if another
    // caller already ran it; failures are reported and do not stop later steps.
    bool shutdown();

    bool clean_shutdown() const noexcept { return clean_.load(); }

    MarketState& market() noexcept { return *state_; }
    StreamIngestor& ingestor() noexcept { return *ingestor_; }
    BatchWriter& writer() noexcept { return *writer_; }
    CommandService& commands() noexcept { return *commands_; }
    IMarketView* view() noexcept { return view_.get(); }

private:
    void register_commands();
    void print_status();
    void print_symbol(const std::string& symbol);
    void report(Severity sev, const std::string& msg, bool persistent = false);

    MonitorOptions opts_;
    ICommandIO& io_;
    MonitorDeps::ViewFactory make_view_;

    std::unique_ptr<MarketState> state_;
    std::unique_ptr<BatchWriter> writer_;
    std::unique_ptr<StreamIngestor> ingestor_;
    std::unique_ptr<CommandService> commands_;
    std::unique_ptr<IMarketView> view_;

    mutable std::mutex shutdown_m_;
    std::condition_variable shutdown_cv_;
    bool shutdown_requested_{false};

    std::atomic<bool> started_{false};
    std::atomic<bool> shut_down_{false};
    std::atomic<bool> clean_{true};
};
