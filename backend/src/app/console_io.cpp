#include "console_io.hpp"

#include <boost/asio/read_until.hpp>

#include <chrono>
#include <istream>
#include <unistd.h>

namespace net = boost::asio;

namespace
{
const char *color_of(Severity sev)
{
    switch (sev)
    {
        case Severity::Info: return "\033[36m";
        case Severity::Success: return "\033[32m";
        case Severity::Warning: return "\033[33m";
        case Severity::Error: return "\033[31m";
    }
    return "";
}
} // namespace

ConsoleIO::ConsoleIO(std::ostream &out, bool color, std::size_t history)
    : out_(out), color_(color), history_cap_(history)
{
    const int fd = ::dup(STDIN_FILENO);
    if (fd >= 0)
    {
        boost::system::error_code ec;
        in_.assign(fd, ec);
        if (ec)
            ::close(fd); // regular files cannot be registered with epoll
        else
            pollable_ = true;
    }
}

ConsoleIO::~ConsoleIO()
{
    interrupt();
    boost::system::error_code ec;
    in_.close(ec);
}

bool ConsoleIO::read_command(std::string &out)
{
    if (closed_.load())
        return false;
    if (pollable_)
        return read_async(out);

    if (!std::getline(std::cin, out))
    {
        closed_.store(true);
        return false;
    }
    return !closed_.load();
}

bool ConsoleIO::read_async(std::string &out)
{
    bool done = false;
    bool got = false;
    ioc_.restart();
    net::async_read_until(in_, buf_, '\n',
        [&](const boost::system::error_code &ec, std::size_t)
        {
            done = true;
            if (ec)
            {
                closed_.store(true); // eof or descriptor closed
                return;
            }
            std::istream is(&buf_);
            std::getline(is, out);
            got = true;
        });

    // Poll in short slices so interrupt() is observed even if it raced restart()
    while (!done && !closed_.load())
        ioc_.run_for(std::chrono::milliseconds(200));

    if (!done)
    {
        boost::system::error_code ec;
        in_.cancel(ec);
        ioc_.restart();
        ioc_.poll(); // let the cancelled handler run before locals go away
    }
    return got && !closed_.load();
}

void ConsoleIO::report(const std::string &message, Severity sev, bool persistent)
{
    std::lock_guard<std::mutex> lk(out_m_);
    if (color_)
        out_ << color_of(sev) << message << "\033[0m\n";
    else
        out_ << "[" << to_cstr(sev) << "] " << message << "\n";
    out_.flush();

    if (persistent)
    {
        history_.push_back(message);
        while (history_.size() > history_cap_)
            history_.pop_front();
    }
}

void ConsoleIO::interrupt() noexcept
{
    closed_.store(true);
    ioc_.stop();
}

std::vector<std::string> ConsoleIO::history() const
{
    std::lock_guard<std::mutex> lk(out_m_);
    return {history_.begin(), history_.end()};
}
