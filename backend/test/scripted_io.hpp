#pragma once
#include "app/command_io.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// ICommandIO fed from a queue. read_command blocks on an empty queue until
// a line is pushed, end of input is signalled, or interrupt() is called.
class ScriptedIO : public ICommandIO {
public:
    struct Message {
        std::string text;
        Severity sev;
        bool persistent;
    };

    void push(const std::string& line) {
        {
            std::lock_guard<std::mutex> lk(m_);
            lines_.push_back(line);
        }
        cv_.notify_all();
    }

    void end_input() {
        {
            std::lock_guard<std::mutex> lk(m_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    bool read_command(std::string& out) override {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return interrupted_ || !lines_.empty() || eof_; });
        if (interrupted_ || lines_.empty()) return false;
        out = lines_.front();
        lines_.pop_front();
        ++consumed_;
        return true;
    }

    void report(const std::string& message, Severity sev, bool persistent = false) override {
        std::function<void(const Message&)> hook;
        {
            std::lock_guard<std::mutex> lk(m_);
            messages_.push_back({message, sev, persistent});
            hook = on_report_;
        }
        if (hook) hook(Message{message, sev, persistent});
    }

    void interrupt() noexcept override {
        {
            std::lock_guard<std::mutex> lk(m_);
            interrupted_ = true;
            ++interrupts_;
        }
        cv_.notify_all();
    }

    void on_report(std::function<void(const Message&)> hook) {
        std::lock_guard<std::mutex> lk(m_);
        on_report_ = std::move(hook);
    }

    std::vector<Message> messages() const {
        std::lock_guard<std::mutex> lk(m_);
        return messages_;
    }

    bool saw(const std::string& fragment, Severity sev) const {
        std::lock_guard<std::mutex> lk(m_);
        for (const auto& m : messages_)
            if (m.sev == sev && m.text.find(fragment) != std::string::npos) return true;
        return false;
    }

    // Lines handed out so far
    std::size_t consumed() const {
        std::lock_guard<std::mutex> lk(m_);
        return consumed_;
    }

    int interrupts() const {
        std::lock_guard<std::mutex> lk(m_);
        return interrupts_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<std::string> lines_;
    std::vector<Message> messages_;
    std::function<void(const Message&)> on_report_;
    std::size_t consumed_{0};
    int interrupts_{0};
    bool interrupted_{false};
    bool eof_{false};
};
