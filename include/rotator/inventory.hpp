#pragma once
// Inventory: banner store with category filtering and weighted rotation
//
// Two phases:
//   1. Build: insert() one record at a time from a single thread.
//   2. Serve: freeze(), then share as std::shared_ptr<const Inventory>.
//      select() is safe for any number of concurrent callers and never
//      blocks; the only mutable state is each banner's atomic counter.
//
// Selection weight is a banner's declared total, not its remaining count.
// Exhausted banners drop out through the eligibility filter only.

#include "banner.hpp"
#include "category_index.hpp"
#include "cumulative_weights.hpp"
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rotator {

enum class ValidationError : uint8_t {
    None,
    IllegalUrl,
    IllegalImpressionAmount,
    EmptyCategories
};

inline const char* to_string(ValidationError e) {
    switch (e) {
        case ValidationError::None: return "ok";
        case ValidationError::IllegalUrl: return "illegal url";
        case ValidationError::IllegalImpressionAmount: return "illegal impression amount";
        case ValidationError::EmptyCategories: return "empty categories";
    }
    return "unknown";
}

constexpr int64_t MAX_IMPRESSIONS = std::numeric_limits<uint32_t>::max();

struct InventoryStats {
    size_t banners = 0;
    size_t exhausted = 0;
    size_t categories = 0;
    size_t taggings = 0;
    uint64_t total_impressions = 0;
    uint64_t remaining_impressions = 0;
    size_t index_bytes = 0;
};

class Inventory {
public:
    Inventory() = default;

    Inventory(const Inventory&) = delete;
    Inventory& operator=(const Inventory&) = delete;

    // Load phase only. Rejected records leave the store untouched.
    ValidationError insert(std::string url, int64_t total,
                           const std::vector<std::string>& categories);

    // End of load phase: freezes the index and the global table
    void freeze();
    bool frozen() const { return frozen_; }

    // Serve one impression. Empty categories draw from every banner.
    // The one-argument form draws from a per-thread engine.
    std::optional<std::string> select(const std::vector<std::string>& categories) const;
    std::optional<std::string> select(const std::vector<std::string>& categories, Rng& rng) const;

    // Eligible positions for a non-empty category list, ascending
    std::vector<BannerPos> filter(const std::vector<std::string>& categories) const;

    size_t size() const { return banners_.size(); }
    const Banner& banner(BannerPos pos) const { return banners_[pos]; }
    const CategoryIndex& index() const { return index_; }
    const CumulativeWeights& global_weights() const { return global_; }

    InventoryStats stats() const;

private:
    const Banner& checked(BannerPos pos) const;
    static Rng& thread_rng();

    // deque keeps element addresses stable across growth
    std::deque<Banner> banners_;
    CategoryIndex index_;
    CumulativeWeights global_ = CumulativeWeights::identity();

    bool frozen_ = false;
};

using InventoryPtr = std::shared_ptr<const Inventory>;

} // namespace rotator
