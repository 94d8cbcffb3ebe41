#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/command_io.hpp"

// Interactive read loop on its own thread. The first whitespace-separated
// token selects a registered command; the rest are passed as arguments.
// "help" is built in.
class CommandService {
public:
    using Args = std::vector<std::string>;
    using Handler = std::function<void(const Args&)>;

    explicit CommandService(ICommandIO& io);
    ~CommandService();

    CommandService(const CommandService&) = delete;
    CommandService& operator=(const CommandService&) = delete;

    // Register before start(); a later registration with the same name replaces it.
    void add_command(const std::string& name, const std::string& help, Handler handler);

    void start();
    // Ends the loop; safe to call from a handler (the loop thread) and repeatedly.
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Runs one input line through the dispatcher (also used by the loop).
    void dispatch(const std::string& line);

    std::vector<std::string> command_names() const;

private:
    struct Command {
        std::string help;
        Handler handler;
    };

    void loop();
    void print_help();

    ICommandIO& io_;
    mutable std::mutex m_;
    std::map<std::string, Command> commands_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::mutex thread_m_;
    std::thread thread_;
};
