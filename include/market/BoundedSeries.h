#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace papertrade {
namespace market {

// One combined, insertion-ordered sequence for all assets, capped per asset.
// T must expose a public `asset` member.
template <typename T>
class BoundedSeries {
public:
    explicit BoundedSeries(std::size_t capacity_per_asset)
        : capacity_(capacity_per_asset) {}

    // Appends, then evicts the oldest entry of the same asset when over capacity.
    void push(T entry) {
        const std::string asset = entry.asset;
        entries_.push_back(std::move(entry));
        std::size_t& count = counts_[asset];
        ++count;

        if (count > capacity_) {
            auto oldest = std::find_if(entries_.begin(), entries_.end(),
                                       [&asset](const T& e) { return e.asset == asset; });
            if (oldest != entries_.end()) {
                entries_.erase(oldest);
                --count;
            }
        }
    }

    const T* latest(const std::string& asset) const {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->asset == asset) {
                return &(*it);
            }
        }
        return nullptr;
    }

    // Last `limit` entries of the asset, oldest first
    std::vector<T> last(const std::string& asset, std::size_t limit) const {
        std::vector<T> out;
        if (limit == 0) {
            return out;
        }
        out.reserve(std::min(limit, count(asset)));
        for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
            if (it->asset == asset) {
                out.push_back(*it);
            }
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::size_t count(const std::string& asset) const {
        auto it = counts_.find(asset);
        return it == counts_.end() ? 0 : it->second;
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }

    std::vector<std::string> assets() const {
        std::vector<std::string> out;
        for (const auto& [asset, count] : counts_) {
            if (count > 0) {
                out.push_back(asset);
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::size_t capacity_;
    std::deque<T> entries_;
    std::unordered_map<std::string, std::size_t> counts_;
};

} // namespace market
} // namespace papertrade
