#pragma once

#include <string>
#include <utility>
#include <vector>

namespace pmx {
namespace utils {

// Numeric helpers shared by the analytics components
namespace stats {

    double mean(const std::vector<double>& values);

    // Population standard deviation (divides by n)
    double population_stddev(const std::vector<double>& values);

    // Pearson coefficient clamped to [-1, 1]; 0 for fewer than 2 points or zero variance
    double pearson(const std::vector<double>& x, const std::vector<double>& y);

    double z_score(double value, double mean, double std_dev);

    // (p_i - p_{i-1}) / p_{i-1}, skipping non-positive bases
    std::vector<double> simple_returns(const std::vector<double>& prices);

    // Largest peak-to-trough decline as a fraction of the peak
    double max_drawdown(const std::vector<double>& prices);

    double clamp(double value, double lo, double hi);

} // namespace stats

// Data formatting
namespace format {

    std::string percent(double ratio, int precision = 1);     // 0.123 -> "12.3%"
    std::string price(double price);                           // 4 decimals below 0.1, else 3
    std::string usd(double amount);                            // -12.5 -> "-$12.50"
    std::string compact_usd(double amount);                    // 64000 -> "$64.0K"

} // namespace format

} // namespace utils
} // namespace pmx
