#include "command_service.hpp"

#include <sstream>

CommandService::CommandService(ICommandIO& io) : io_(io) {
    add_command("help", "list available commands", [this](const Args&) { print_help(); });
}

CommandService::~CommandService() {
    stop();
    std::lock_guard<std::mutex> lk(thread_m_);
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) thread_.detach();
        else thread_.join();
    }
}

void CommandService::add_command(const std::string& name, const std::string& help, Handler handler) {
    std::lock_guard<std::mutex> lk(m_);
    commands_[name] = Command{help, std::move(handler)};
}

std::vector<std::string> CommandService::command_names() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::string> names;
    for (const auto& kv : commands_) names.push_back(kv.first);
    return names;
}

void CommandService::start() {
    std::lock_guard<std::mutex> lk(thread_m_);
    if (stopped_.load() || thread_.joinable()) return;
    running_.store(true);
    thread_ = std::thread([this] { loop(); });
}

void CommandService::stop() {
    stopped_.store(true);
    io_.interrupt();

    std::thread t;
    {
        std::lock_guard<std::mutex> lk(thread_m_);
        // A handler calling stop() cannot join its own thread; the destructor does.
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            t = std::move(thread_);
    }
    if (t.joinable()) t.join();
}

void CommandService::loop() {
    std::string line;
    while (!stopped_.load()) {
        if (!io_.read_command(line)) break;
        dispatch(line);
    }
    running_.store(false);
}

void CommandService::dispatch(const std::string& line) {
    std::istringstream is(line);
    std::string name;
    if (!(is >> name)) return; // blank line

    Args args;
    for (std::string a; is >> a;) args.push_back(a);

    Handler handler;
    {
        std::lock_guard<std::mutex> lk(m_);
        auto it = commands_.find(name);
        if (it != commands_.end()) handler = it->second.handler;
    }
    if (!handler) {
        io_.report("Unknown command: '" + name + "'. Type 'help' for available commands.", Severity::Error);
        return;
    }

    try {
        handler(args);
    } catch (const std::exception& e) {
        io_.report("Command '" + name + "' failed: " + e.what(), Severity::Error);
    }
}

void CommandService::print_help() {
    std::ostringstream os;
    os << "Available commands:";
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& [name, cmd] : commands_) {
        os << "\n  " << name;
        if (name.size() < 12) os << std::string(12 - name.size(), ' ');
        os << cmd.help;
    }
    io_.report(os.str(), Severity::Info);
}
