#include "utils/stats_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace pmx {
namespace utils {

namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double population_stddev(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    const double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    if (var_x <= 0.0 || var_y <= 0.0) return 0.0;

    return clamp(cov / std::sqrt(var_x * var_y), -1.0, 1.0);
}

double z_score(double value, double mean, double std_dev) {
    if (std_dev <= 0) return 0.0;
    return (value - mean) / std_dev;
}

std::vector<double> simple_returns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) return returns;

    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] > 0) {
            returns.push_back((prices[i] - prices[i - 1]) / prices[i - 1]);
        }
    }
    return returns;
}

double max_drawdown(const std::vector<double>& prices) {
    if (prices.empty()) return 0.0;

    double peak = prices.front();
    double worst = 0.0;
    for (double p : prices) {
        peak = std::max(peak, p);
        if (peak > 0) {
            worst = std::max(worst, (peak - p) / peak);
        }
    }
    return worst;
}

double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

} // namespace stats

namespace format {

std::string percent(double ratio, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << ratio * 100.0 << "%";
    return oss.str();
}

std::string price(double price) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(price < 0.1 ? 4 : 3) << price;
    return oss.str();
}

std::string usd(double amount) {
    std::ostringstream oss;
    if (amount < 0) {
        oss << "-";
    }
    oss << "$" << std::fixed << std::setprecision(2) << std::fabs(amount);
    return oss.str();
}

std::string compact_usd(double amount) {
    std::ostringstream oss;
    oss << "$" << std::fixed;
    if (amount >= 1e9) {
        oss << std::setprecision(1) << amount / 1e9 << "B";
    } else if (amount >= 1e6) {
        oss << std::setprecision(1) << amount / 1e6 << "M";
    } else if (amount >= 1e3) {
        oss << std::setprecision(1) << amount / 1e3 << "K";
    } else {
        oss << std::setprecision(0) << amount;
    }
    return oss.str();
}

} // namespace format

} // namespace utils
} // namespace pmx
