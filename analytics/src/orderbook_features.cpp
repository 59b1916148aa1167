#include "orderbook_features.hpp"
#include "core/exceptions.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>

namespace pmx {
namespace analytics {

using types::BookSide;
using types::OrderBook;
using types::OrderBookLevel;

namespace {

// Numbers pass through, numeric strings are parsed in full, anything else is rejected
bool coerce_number(const nlohmann::json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return true;
    }
    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        if (text.empty()) return false;
        char* end = nullptr;
        out = std::strtod(text.c_str(), &end);
        return end != nullptr && *end == '\0';
    }
    return false;
}

bool extract_entry(const nlohmann::json& entry, double& price, double& size) {
    if (entry.is_array() && entry.size() >= 2) {
        return coerce_number(entry[0], price) && coerce_number(entry[1], size);
    }
    if (entry.is_object() && entry.contains("price") && entry.contains("size")) {
        return coerce_number(entry["price"], price) && coerce_number(entry["size"], size);
    }
    return false;
}

// Merge duplicate prices and order best-first
std::vector<OrderBookLevel> merge_and_sort(const std::vector<std::pair<double, double>>& raw, BookSide side) {
    std::map<double, double> merged;
    for (const auto& [price, size] : raw) {
        if (!std::isfinite(price) || !std::isfinite(size) || price < 0 || size < 0) {
            continue;
        }
        merged[price] += size;
    }

    std::vector<OrderBookLevel> levels;
    levels.reserve(merged.size());
    for (const auto& [price, size] : merged) {
        levels.emplace_back(price, size, side);
    }

    if (side == BookSide::BID) {
        std::reverse(levels.begin(), levels.end());
    }
    return levels;
}

double side_depth(const std::vector<OrderBookLevel>& levels) {
    double total = 0.0;
    for (const auto& level : levels) {
        total += level.size;
    }
    return total;
}

} // namespace

OrderbookFeatureExtractor::OrderbookFeatureExtractor(const OrderbookConfig& config)
    : config_(config) {
    if (config_.top_levels == 0) {
        config_.top_levels = 1;
    }
}

std::vector<OrderBookLevel> OrderbookFeatureExtractor::normalize_side(const nlohmann::json& raw, BookSide side) {
    std::vector<std::pair<double, double>> entries;

    if (raw.is_null()) {
        return {};
    }

    if (raw.is_array()) {
        size_t dropped = 0;
        for (const auto& entry : raw) {
            double price = 0.0;
            double size = 0.0;
            if (extract_entry(entry, price, size)) {
                entries.emplace_back(price, size);
            } else {
                ++dropped;
            }
        }
        if (dropped > 0) {
            utils::Logger::debug("Dropped {} unreadable {} levels", dropped, types::to_string(side));
        }
    } else if (raw.is_object()) {
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            double price = 0.0;
            double size = 0.0;
            if (coerce_number(nlohmann::json(it.key()), price) && coerce_number(it.value(), size)) {
                entries.emplace_back(price, size);
            }
        }
    } else {
        throw ValidationError("order book " + types::to_string(side) +
                              " side must be an array, an object or null, got " + raw.type_name());
    }

    return merge_and_sort(entries, side);
}

std::vector<OrderBookLevel> OrderbookFeatureExtractor::normalize_side(const std::vector<OrderBookLevel>& levels,
                                                                     BookSide side) {
    std::vector<std::pair<double, double>> entries;
    entries.reserve(levels.size());
    for (const auto& level : levels) {
        entries.emplace_back(level.price, level.size);
    }
    return merge_and_sort(entries, side);
}

OrderBook OrderbookFeatureExtractor::normalize(const OrderBook& book) {
    OrderBook normalized;
    normalized.bids = normalize_side(book.bids, BookSide::BID);
    normalized.asks = normalize_side(book.asks, BookSide::ASK);
    return normalized;
}

OrderBook OrderbookFeatureExtractor::parse_book(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw ValidationError(std::string("order book payload must be an object, got ") + payload.type_name());
    }

    const nlohmann::json null_side;
    OrderBook book;
    book.bids = normalize_side(payload.contains("bids") ? payload["bids"] : null_side, BookSide::BID);
    book.asks = normalize_side(payload.contains("asks") ? payload["asks"] : null_side, BookSide::ASK);
    return book;
}

Result<double> OrderbookFeatureExtractor::slippage(const std::vector<OrderBookLevel>& asks, double size) const {
    if (!std::isfinite(size) || size <= 0) {
        return Result<double>::error(ErrorKind::INVALID_INPUT, "order size must be positive");
    }

    const size_t levels = std::min(asks.size(), config_.top_levels);
    double remaining = size;
    double total_cost = 0.0;

    for (size_t i = 0; i < levels && remaining > 0; ++i) {
        double take = std::min(remaining, asks[i].size);
        total_cost += take * asks[i].price;
        remaining -= take;
    }

    if (remaining > 0) {
        return Result<double>::error(ErrorKind::UNFILLABLE,
            "insufficient ask liquidity for size " + std::to_string(size));
    }

    const double best_ask = asks.front().price;
    if (best_ask <= 0) {
        return Result<double>::error(ErrorKind::INVALID_INPUT, "best ask must be positive");
    }

    const double avg_fill_price = total_cost / size;
    return Result<double>::success((avg_fill_price - best_ask) / best_ask);
}

Result<OrderbookFeatures> OrderbookFeatureExtractor::extract(const OrderBook& raw_book) const {
    const OrderBook book = normalize(raw_book);
    const bool has_bids = !book.bids.empty();
    const bool has_asks = !book.asks.empty();

    OrderbookFeatures features;
    features.best_bid = has_bids ? book.bids.front().price : 0.0;
    features.best_ask = has_asks ? book.asks.front().price : 0.0;

    if (has_bids && has_asks) {
        features.mid = (features.best_bid + features.best_ask) / 2.0;
        features.spread = features.best_ask - features.best_bid;
        features.crossed = features.best_bid > features.best_ask;
    } else if (has_bids) {
        features.mid = features.best_bid;
    } else if (has_asks) {
        features.mid = features.best_ask;
    }

    if (features.crossed) {
        if (config_.reject_crossed_books) {
            return Result<OrderbookFeatures>::error(ErrorKind::INVALID_INPUT,
                "crossed book: best bid " + std::to_string(features.best_bid) +
                " above best ask " + std::to_string(features.best_ask));
        }
        utils::Logger::warn("Crossed book: bid {} > ask {}", features.best_bid, features.best_ask);
    }

    features.spread_percent = features.best_ask > 0 ? features.spread / features.best_ask * 100.0 : 0.0;

    features.depth.bid = side_depth(book.bids);
    features.depth.ask = side_depth(book.asks);
    features.depth.total = features.depth.bid + features.depth.ask;
    features.imbalance = features.depth.total > 0
        ? (features.depth.bid - features.depth.ask) / features.depth.total
        : 0.0;

    features.slippage.small = slippage(book.asks, config_.small_order_size);
    features.slippage.medium = slippage(book.asks, config_.medium_order_size);
    features.slippage.large = slippage(book.asks, config_.large_order_size);

    features.top_bids = top_levels(book.bids);
    features.top_asks = top_levels(book.asks);
    features.interpretation = interpret(features, has_bids && has_asks);

    return Result<OrderbookFeatures>::success(std::move(features));
}

Result<OrderbookFeatures> OrderbookFeatureExtractor::extract(const nlohmann::json& payload) const {
    return extract(parse_book(payload));
}

std::vector<BookLevelView> OrderbookFeatureExtractor::top_levels(const std::vector<OrderBookLevel>& levels) const {
    std::vector<BookLevelView> view;
    const size_t count = std::min(levels.size(), config_.top_levels);
    view.reserve(count);

    double cumulative = 0.0;
    for (size_t i = 0; i < count; ++i) {
        cumulative += levels[i].size;
        view.emplace_back(levels[i].price, levels[i].size, cumulative);
    }
    return view;
}

std::string OrderbookFeatureExtractor::interpret(const OrderbookFeatures& features, bool both_sides) const {
    std::vector<std::string> clauses;

    if (both_sides) {
        if (features.spread_percent < config_.very_tight_spread_percent) {
            clauses.push_back("Very tight spread indicates high liquidity");
        } else if (features.spread_percent < config_.tight_spread_percent) {
            clauses.push_back("Tight spread indicates good liquidity");
        } else if (features.spread_percent < config_.moderate_spread_percent) {
            clauses.push_back("Moderate spread");
        } else {
            clauses.push_back("Wide spread suggests low liquidity or high uncertainty");
        }
    }

    if (features.imbalance > config_.imbalance_threshold) {
        clauses.push_back("Strong bid pressure (bullish sentiment)");
    } else if (features.imbalance < -config_.imbalance_threshold) {
        clauses.push_back("Strong ask pressure (bearish sentiment)");
    } else {
        clauses.push_back("Balanced orderbook");
    }

    if (features.depth.total > config_.deep_book_depth) {
        clauses.push_back("Deep orderbook with strong liquidity");
    } else if (features.depth.total > config_.adequate_book_depth) {
        clauses.push_back("Adequate liquidity");
    } else {
        clauses.push_back("Shallow orderbook, low liquidity");
    }

    const auto& medium = features.slippage.medium;
    const auto& large = features.slippage.large;
    if (medium.is_success() && medium.value() > config_.high_slippage_threshold) {
        clauses.push_back("High slippage for medium orders");
    } else if (large.is_success() && large.value() > config_.high_slippage_threshold) {
        clauses.push_back("High slippage for large orders");
    }

    std::string text;
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i > 0) text += ". ";
        text += clauses[i];
    }
    text += ".";
    return text;
}

} // namespace analytics
} // namespace pmx
