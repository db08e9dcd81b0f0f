#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace papertrade {
namespace strategy {

// Last max_size prices seen by a strategy, oldest first.
class PriceHistory {
public:
    explicit PriceHistory(std::size_t max_size) : max_size_(max_size) {}

    void push(double price) {
        prices_.push_back(price);
        while (prices_.size() > max_size_) {
            prices_.pop_front();
        }
    }

    std::vector<double> lastN(std::size_t n) const {
        const std::size_t start = prices_.size() > n ? prices_.size() - n : 0;
        return std::vector<double>(prices_.begin() + static_cast<std::ptrdiff_t>(start), prices_.end());
    }

    bool hasAtLeast(std::size_t n) const { return prices_.size() >= n; }
    std::size_t size() const { return prices_.size(); }
    std::size_t maxSize() const { return max_size_; }

private:
    std::deque<double> prices_;
    std::size_t max_size_;
};

} // namespace strategy
} // namespace papertrade
