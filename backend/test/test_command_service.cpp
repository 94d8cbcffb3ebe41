#include "app/command_service.hpp"
#include "app/console_io.hpp"
#include "scripted_io.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

template <class Pred>
static bool wait_until(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

static void dispatch_direct() {
    ScriptedIO io;
    CommandService svc(io);
    std::vector<std::string> got;
    svc.add_command("show", "show a symbol", [&](const CommandService::Args& a) { got = a; });
    svc.add_command("boom", "always fails", [](const CommandService::Args&) {
        throw std::runtime_error("kaput");
    });

    svc.dispatch("  show   BTC  extra ");
    assert((got == std::vector<std::string>{"BTC", "extra"}));

    svc.dispatch("");
    assert(io.messages().empty());

    svc.dispatch("frobnicate");
    assert(io.saw("Unknown command: 'frobnicate'", Severity::Error));

    svc.dispatch("boom");
    assert(io.saw("Command 'boom' failed: kaput", Severity::Error));

    svc.dispatch("help");
    assert(io.saw("Available commands:", Severity::Info));
    assert(io.saw("show", Severity::Info) && io.saw("always fails", Severity::Info));

    auto names = svc.command_names();
    assert((names == std::vector<std::string>{"boom", "help", "show"}));
}

static void loop_runs_until_end_of_input() {
    ScriptedIO io;
    CommandService svc(io);
    std::atomic<int> pings{0};
    svc.add_command("ping", "count", [&](const CommandService::Args&) { ++pings; });

    svc.start();
    assert(svc.running());
    io.push("ping");
    io.push("nope");
    io.push("ping");
    io.end_input();
    assert(wait_until([&] { return !svc.running(); }));
    assert(pings == 2);
    assert(io.saw("Unknown command: 'nope'", Severity::Error));
    svc.stop();
}

static void stop_from_handler_and_outside() {
    // quit-style handler stopping the loop from its own thread
    {
        ScriptedIO io;
        CommandService svc(io);
        svc.add_command("quit", "leave", [&](const CommandService::Args&) { svc.stop(); });
        svc.start();
        io.push("quit");
        io.push("help");
        assert(wait_until([&] { return !svc.running(); }));
        assert(io.consumed() == 1);
    }
    // stop() from another thread unblocks a pending read
    {
        ScriptedIO io;
        CommandService svc(io);
        svc.start();
        std::this_thread::sleep_for(10ms);
        svc.stop();
        assert(!svc.running());
        assert(io.interrupts() >= 1);
        svc.stop();
        svc.start(); // stopped services do not restart
        assert(!svc.running());
    }
}

static void console_reporting() {
    std::ostringstream out;
    ConsoleIO console(out, false, 2);
    console.report("one", Severity::Info, true);
    console.report("transient", Severity::Warning);
    console.report("two", Severity::Success, true);
    console.report("three", Severity::Error, true);
    assert(out.str() == "[info] one\n[warn] transient\n[ok] two\n[error] three\n");
    assert((console.history() == std::vector<std::string>{"two", "three"}));

    console.interrupt();
    std::string line;
    assert(!console.read_command(line));
}

int main() {
    dispatch_direct();
    loop_runs_until_end_of_input();
    stop_from_handler_and_outside();
    console_reporting();
    std::cout << "OK\n";
    return 0;
}
