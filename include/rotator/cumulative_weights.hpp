#pragma once
// Cumulative Weights: weighted random pick by prefix-sum search
//
// Weights are accumulated into a non-decreasing sequence of prefix sums.
// A draw takes r uniform over [0, W] and returns the first position whose
// prefix sum is >= r, found by binary search in O(log N).
//
// The table position is translated to a banner position through the
// projection: Identity when the table covers every banner in load order,
// or an explicit position list when it covers a filtered subset.

#include "banner.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <variant>
#include <vector>

namespace rotator {

using Rng = std::mt19937_64;

class CumulativeWeights {
public:
    struct Identity {};
    using Projection = std::vector<BannerPos>;

    // Table over all banners, table position == banner position
    static CumulativeWeights identity() {
        return CumulativeWeights(Identity{});
    }

    // Table over an explicit subset of banners
    static CumulativeWeights projected(size_t expected = 0) {
        CumulativeWeights w{Projection{}};
        w.reserve(expected);
        return w;
    }

    void reserve(size_t n) {
        sums_.reserve(n);
        if (auto* p = std::get_if<Projection>(&projection_)) {
            p->reserve(n);
        }
    }

    void shrink_to_fit() {
        sums_.shrink_to_fit();
        if (auto* p = std::get_if<Projection>(&projection_)) {
            p->shrink_to_fit();
        }
    }

    void add_weight(uint32_t weight) {
        if (!is_identity()) {
            fatal("weights", "add_weight() on a projected table");
        }
        push(weight);
    }

    void add_weight_for(uint32_t weight, BannerPos pos) {
        auto* p = std::get_if<Projection>(&projection_);
        if (!p) {
            fatal("weights", "add_weight_for() on an identity table");
        }
        p->push_back(pos);
        push(weight);
    }

    std::optional<BannerPos> select(Rng& rng) const {
        if (sums_.empty()) return std::nullopt;

        size_t idx = 0;
        if (sums_.size() > 1) {
            std::uniform_int_distribution<uint64_t> dist(0, sums_.back());
            uint64_t r = dist(rng);
            idx = static_cast<size_t>(
                std::lower_bound(sums_.begin(), sums_.end(), r) - sums_.begin());
        }
        return project(idx);
    }

    size_t size() const { return sums_.size(); }
    bool empty() const { return sums_.empty(); }
    uint64_t total() const { return sums_.empty() ? 0 : sums_.back(); }
    bool is_identity() const { return std::holds_alternative<Identity>(projection_); }

    const std::vector<uint64_t>& prefix_sums() const { return sums_; }

private:
    explicit CumulativeWeights(Identity) : projection_(Identity{}) {}
    explicit CumulativeWeights(Projection positions) : projection_(std::move(positions)) {}

    void push(uint32_t weight) {
        uint64_t last = sums_.empty() ? 0 : sums_.back();
        sums_.push_back(last + weight);
    }

    BannerPos project(size_t idx) const {
        if (const auto* p = std::get_if<Projection>(&projection_)) {
            return (*p)[idx];
        }
        return static_cast<BannerPos>(idx);
    }

    std::vector<uint64_t> sums_;
    std::variant<Identity, Projection> projection_;
};

} // namespace rotator
