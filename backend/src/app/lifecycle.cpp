#include "lifecycle.hpp"
#include "md/symbol_codec.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

ICommandIO& require_io(ICommandIO* io) {
    if (!io) throw std::invalid_argument("command IO is required");
    return *io;
}

std::string fmt_num(double v, int prec = 2) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

} // namespace

LifecycleCoordinator::LifecycleCoordinator(MonitorOptions opts, MonitorDeps deps)
    : opts_(std::move(opts)), io_(require_io(deps.io)), make_view_(std::move(deps.make_view))
{
    if (!deps.ws || !deps.decoder || !deps.store)
        throw std::invalid_argument("feed session, decoder and record store are required");

    auto to_io = [this](Severity sev, const std::string& msg) { io_.report(msg, sev); };

    state_ = std::make_unique<MarketState>(opts_.symbols, opts_.history_capacity);
    writer_ = std::make_unique<BatchWriter>(std::move(deps.store), opts_.writer, to_io);
    ingestor_ = std::make_unique<StreamIngestor>(
        opts_.ingestor, std::move(deps.ws), std::move(deps.decoder), std::move(deps.snapshots),
        *state_, *writer_, to_io,
        [](ConnectionState s) { log_line("lifecycle", std::string("connection ") + to_cstr(s)); });
    commands_ = std::make_unique<CommandService>(io_);
    register_commands();
}

LifecycleCoordinator::~LifecycleCoordinator() {
    shutdown();
}

void LifecycleCoordinator::report(Severity sev, const std::string& msg, bool persistent) {
    io_.report(msg, sev, persistent);
}

void LifecycleCoordinator::register_commands() {
    commands_->add_command("status", "show connection, symbol and storage status",
                           [this](const CommandService::Args&) { print_status(); });

    commands_->add_command("reconnect", "drop the feed connection and connect again",
                           [this](const CommandService::Args&) {
                               report(Severity::Info, "Reconnecting to the market data feed...");
                               ingestor_->reconnect();
                           });

    commands_->add_command("flush", "write pending records to the database now",
                           [this](const CommandService::Args&) {
                               auto st = writer_->flush();
                               if (st.ok)
                                   report(Severity::Success, "Flushed " + std::to_string(st.written) + " records.");
                               else
                                   report(Severity::Error, "Flush failed, " + std::to_string(st.unwritten) +
                                                               " records still pending: " + st.error);
                           });

    commands_->add_command("show", "show <SYMBOL>: best bid/ask and recent trades",
                           [this](const CommandService::Args& args) {
                               if (args.empty()) {
                                   report(Severity::Warning, "Usage: show <SYMBOL>");
                                   return;
                               }
                               print_symbol(args.front());
                           });

    commands_->add_command("quit", "flush data and exit",
                           [this](const CommandService::Args&) {
                               report(Severity::Info, "Shutting down...", true);
                               request_shutdown();
                           });
}

void LifecycleCoordinator::print_status() {
    std::ostringstream os;
    os << "Connection: " << to_cstr(ingestor_->state()) << "\n";

    for (const auto& s : state_->summary()) {
        os << "  " << s.symbol << ": " << s.trades << " trades";
        if (s.has_book)
            os << ", book seq " << s.sequence << " (" << s.bid_levels << "x" << s.ask_levels << ")";
        else
            os << ", no book";
        os << "\n";
    }

    auto ws = writer_->stats();
    os << "Storage (" << writer_->store_name() << "): " << ws.written << " written in "
       << ws.batches_written << " batches, " << ws.pending << " pending, " << ws.sealed
       << " queued, " << ws.failed_attempts << " failed attempts";

    auto is = ingestor_->stats();
    os << "\nFeed: " << is.messages << " messages, " << is.decode_errors << " decode errors, "
       << is.desyncs << " resyncs, " << is.connects << " connects";
    report(Severity::Info, os.str());
}

void LifecycleCoordinator::print_symbol(const std::string& symbol) {
    auto snap = state_->snapshot(SymbolCodec::normalize(symbol));
    if (!snap) {
        report(Severity::Error, "Unknown symbol: " + symbol);
        return;
    }

    std::ostringstream os;
    os << snap->symbol;
    if (snap->book && !snap->book->bids.empty() && !snap->book->asks.empty()) {
        const auto& bid = snap->book->bids.front();
        const auto& ask = snap->book->asks.front();
        os << "  bid " << fmt_num(bid.first) << " x " << fmt_num(bid.second, 4)
           << "  ask " << fmt_num(ask.first) << " x " << fmt_num(ask.second, 4)
           << "  spread " << fmt_num(ask.first - bid.first);
    } else {
        os << "  no order book yet";
    }

    constexpr std::size_t kShown = 5;
    std::size_t from = snap->trades.size() > kShown ? snap->trades.size() - kShown : 0;
    for (std::size_t i = snap->trades.size(); i-- > from;) {
        const auto& t = snap->trades[i];
        os << "\n  " << to_cstr(t.side) << " " << fmt_num(t.quantity, 6) << " @ " << fmt_num(t.price);
    }
    report(Severity::Info, os.str());
}

void LifecycleCoordinator::start() {
    if (started_.exchange(true)) return;

    report(Severity::Info, "crypto-monitor " + opts_.version, true);
    report(Severity::Info, "Database: " + opts_.db_label, true);
    std::string syms;
    for (const auto& s : opts_.symbols) syms += (syms.empty() ? "" : ", ") + s;
    report(Severity::Info, "Tracking: " + syms, true);

    commands_->start();
    ingestor_->connect();

    if (opts_.enable_viz && make_view_) {
        report(Severity::Info, "Starting visualization...");
        view_ = make_view_(*state_, *ingestor_, *writer_);
        if (view_ && view_->start())
            report(Severity::Success, "Visualization started." +
                                          (opts_.viz_url.empty() ? std::string() : " Open " + opts_.viz_url + " in your browser."),
                   true);
        else
            report(Severity::Error, "Visualization failed to start; continuing without it.", true);
    }

    report(Severity::Info, "Type 'help' for available commands, 'status' for connection info, or 'reconnect' to reset connection.", true);
}

void LifecycleCoordinator::request_shutdown() {
    {
        std::lock_guard<std::mutex> lk(shutdown_m_);
        shutdown_requested_ = true;
    }
    shutdown_cv_.notify_all();
}

void LifecycleCoordinator::wait_for_shutdown() {
    std::unique_lock<std::mutex> lk(shutdown_m_);
    shutdown_cv_.wait(lk, [this] { return shutdown_requested_; });
}

bool LifecycleCoordinator::shutdown_requested() const {
    std::lock_guard<std::mutex> lk(shutdown_m_);
    return shutdown_requested_;
}

bool LifecycleCoordinator::shutdown() {
    if (shut_down_.exchange(true)) return false;
    request_shutdown();
    report(Severity::Info, "Cleaning up application resources...", true);

    auto step = [this](const char* what, auto&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            clean_.store(false);
            report(Severity::Error, std::string("Error while ") + what + ": " + e.what(), true);
        }
    };

    step("stopping commands", [this] { commands_->stop(); });
    step("closing the feed", [this] { ingestor_->close(); });
    step("stopping the visualization", [this] {
        if (view_) view_->stop();
    });
    step("flushing records", [this] {
        report(Severity::Info, "Flushing remaining database records...", true);
        auto st = writer_->flush();
        if (!st.ok) {
            clean_.store(false);
            report(Severity::Error, "Final flush failed: " + std::to_string(st.unwritten) +
                                        " records at risk: " + st.error, true);
        }
    });
    step("closing the database", [this] {
        auto st = writer_->close();
        if (st.ok) {
            report(Severity::Success, "Database closed successfully.", true);
        } else {
            clean_.store(false);
            report(Severity::Error, "Database closed with " + std::to_string(st.unwritten) +
                                        " unwritten records: " + st.error, true);
        }
    });

    report(Severity::Success, "Application shutdown complete.", true);
    return true;
}
