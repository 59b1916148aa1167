#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace pmx {
namespace types {

// Basic numeric types
using Price = double;        // Implied probability in [0, 1]
using Quantity = double;     // Shares / contracts
using Amount = double;       // Notional in quote currency
using Timestamp = int64_t;   // Unix timestamp in milliseconds

using MarketId = std::string;
using TokenId = std::string;

enum class BookSide {
    BID,
    ASK
};

enum class OrderSide {
    BUY,
    SELL
};

enum class Outcome {
    YES,
    NO
};

// Single observation of a market's implied probability
struct PricePoint {
    Timestamp timestamp;
    Price price;
    std::optional<double> volume;

    PricePoint() : timestamp(0), price(0.0) {}
    PricePoint(Timestamp ts, Price p) : timestamp(ts), price(p) {}
    PricePoint(Timestamp ts, Price p, double vol) : timestamp(ts), price(p), volume(vol) {}
};

using PriceSeries = std::vector<PricePoint>;

// Price history tagged with the market (or outcome token) it belongs to
struct MarketHistory {
    MarketId market_id;
    PriceSeries prices;

    MarketHistory() = default;
    MarketHistory(const MarketId& id, PriceSeries series)
        : market_id(id), prices(std::move(series)) {}
};

// Order book level
struct OrderBookLevel {
    Price price;
    Quantity size;
    BookSide side;

    OrderBookLevel() : price(0.0), size(0.0), side(BookSide::BID) {}
    OrderBookLevel(Price p, Quantity q, BookSide s) : price(p), size(q), side(s) {}
};

// Order book structure
struct OrderBook {
    std::vector<OrderBookLevel> bids;  // Sorted by price descending
    std::vector<OrderBookLevel> asks;  // Sorted by price ascending

    bool empty() const { return bids.empty() && asks.empty(); }
};

// Market metadata supplied by the caller
struct MarketInfo {
    MarketId id;
    std::string title;
    Price yes_mid;
    Price no_mid;
    double spread;
    Amount liquidity;
    Amount volume;
    double resolution_horizon_days;
    std::string cluster_key;        // Markets curated into the same cluster
    std::string term_key;           // Same question, different resolution dates
    bool mutually_exclusive;        // Member of the cluster's exclusive outcome group
    double last_update_age_minutes;
    std::optional<OrderBook> yes_book;
    std::optional<OrderBook> no_book;

    MarketInfo()
        : yes_mid(0.0), no_mid(0.0), spread(0.0), liquidity(0.0), volume(0.0),
          resolution_horizon_days(0.0), mutually_exclusive(false),
          last_update_age_minutes(0.0) {}

    Price mid_for(Outcome outcome) const {
        return outcome == Outcome::YES ? yes_mid : no_mid;
    }

    const std::optional<OrderBook>& book_for(Outcome outcome) const {
        return outcome == Outcome::YES ? yes_book : no_book;
    }
};

// Utility functions
std::string to_string(BookSide side);
std::string to_string(OrderSide side);
std::string to_string(Outcome outcome);

bool is_valid_probability(double value);
bool is_valid_size(double value);

} // namespace types
} // namespace pmx
