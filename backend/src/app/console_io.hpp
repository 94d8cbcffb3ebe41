#pragma once
#include "command_io.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>

#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

// Terminal collaborator: reads commands from stdin, prints colored messages
// to stdout. Reads go through an asio stream descriptor so interrupt() can
// end a pending read; a non-pollable stdin (regular file) falls back to
// blocking getline.
class ConsoleIO final : public ICommandIO
{
public:
    explicit ConsoleIO(std::ostream &out = std::cout, bool color = true, std::size_t history = 200);
    ~ConsoleIO();

    bool read_command(std::string &out) override;
    void report(const std::string &message, Severity sev, bool persistent = false) override;
    void interrupt() noexcept override;

    // Persistent messages, oldest first.
    std::vector<std::string> history() const;

private:
    bool read_async(std::string &out);

    std::ostream &out_;
    bool color_;
    std::size_t history_cap_;

    boost::asio::io_context ioc_{1};
    boost::asio::posix::stream_descriptor in_{ioc_};
    boost::asio::streambuf buf_;
    bool pollable_{false};
    std::atomic<bool> closed_{false};

    mutable std::mutex out_m_;
    std::deque<std::string> history_;
};
