#pragma once
#include <string>
#include "util/log.hpp"

// Command input/output collaborator used by CommandService and the coordinator.
struct ICommandIO
{
    virtual ~ICommandIO() = default;

    // Blocks for the next line; false at end of input or after interrupt().
    virtual bool read_command(std::string &out) = 0;

    // persistent messages stay in the message history; others are transient
    virtual void report(const std::string &message, Severity sev, bool persistent = false) = 0;

    // Unblocks read_command() from another thread; idempotent.
    virtual void interrupt() noexcept = 0;
};

// Optional view over the market state (visualization, dashboards).
struct IMarketView
{
    virtual ~IMarketView() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;
};
