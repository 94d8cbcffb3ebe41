#pragma once
#include "md_types.hpp"
#include <optional>
#include <string>
#include <vector>

enum class DecodeStatus
{
    Records,  // one or more records appended to out
    Control,  // valid frame without market data (subscription ack, ...)
    Malformed // unparseable or missing required fields
};

// Uniform interface for a venue frame decoder.
struct IFeedDecoder
{
    virtual ~IFeedDecoder() = default;
    virtual DecodeStatus decode(const std::string &raw, std::vector<MarketRecord> &out) = 0;
};

// Source of full book snapshots for resynchronization.
struct IBookSnapshotSource
{
    virtual ~IBookSnapshotSource() = default;
    // nullopt when the snapshot could not be obtained
    virtual std::optional<OrderBookUpdate> fetch(const std::string &symbol) = 0;
};
