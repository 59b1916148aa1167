#include "types/common_types.hpp"
#include <cmath>

namespace pmx {
namespace types {

std::string to_string(BookSide side) {
    switch (side) {
        case BookSide::BID: return "bid";
        case BookSide::ASK: return "ask";
        default: return "unknown";
    }
}

std::string to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "buy";
        case OrderSide::SELL: return "sell";
        default: return "unknown";
    }
}

std::string to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::YES: return "yes";
        case Outcome::NO: return "no";
        default: return "unknown";
    }
}

bool is_valid_probability(double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

bool is_valid_size(double value) {
    return std::isfinite(value) && value >= 0.0;
}

} // namespace types
} // namespace pmx
