#include <rotator/inventory.hpp>
#include <string>

namespace rotator {

ValidationError Inventory::insert(std::string url, int64_t total,
                                  const std::vector<std::string>& categories) {
    if (frozen_) {
        fatal("inventory", "insert() after freeze()");
    }

    if (url.empty()) return ValidationError::IllegalUrl;
    if (total <= 0 || total > MAX_IMPRESSIONS) return ValidationError::IllegalImpressionAmount;
    if (categories.empty()) return ValidationError::EmptyCategories;

    if (banners_.size() >= std::numeric_limits<BannerPos>::max()) {
        fatal("inventory", "banner position space exhausted");
    }

    auto weight = static_cast<uint32_t>(total);
    auto pos = static_cast<BannerPos>(banners_.size());
    banners_.emplace_back(std::move(url), weight);
    index_.add(pos, categories);
    global_.add_weight(weight);

    return ValidationError::None;
}

void Inventory::freeze() {
    if (frozen_) return;

    if (index_.position_bound() > banners_.size()) {
        fatal("inventory", "category index references a missing banner");
    }
    if (global_.size() != banners_.size()) {
        fatal("inventory", "global weight table out of step with banners");
    }

    index_.freeze();
    global_.shrink_to_fit();
    frozen_ = true;

    log_debug("inventory", "frozen: banners=%zu categories=%zu weight=%llu",
              banners_.size(), index_.category_count(),
              static_cast<unsigned long long>(global_.total()));
}

Rng& Inventory::thread_rng() {
    thread_local Rng rng = []() {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        return Rng(seq);
    }();
    return rng;
}

const Banner& Inventory::checked(BannerPos pos) const {
    if (pos >= banners_.size()) {
        fatal("inventory", "selection produced a position outside the store");
    }
    return banners_[pos];
}

std::vector<BannerPos> Inventory::filter(const std::vector<std::string>& categories) const {
    std::vector<BannerPos> eligible = index_.candidates(categories);

    // Eligibility snapshot: a banner read as exhausted here is skipped,
    // one read as available may still run dry before show()
    size_t kept = 0;
    for (BannerPos pos : eligible) {
        if (checked(pos).can_show()) {
            eligible[kept++] = pos;
        }
    }
    eligible.resize(kept);
    return eligible;
}

std::optional<std::string> Inventory::select(const std::vector<std::string>& categories) const {
    return select(categories, thread_rng());
}

std::optional<std::string> Inventory::select(const std::vector<std::string>& categories,
                                             Rng& rng) const {
    std::optional<BannerPos> winner;

    if (categories.empty()) {
        winner = global_.select(rng);
    } else {
        std::vector<BannerPos> eligible = filter(categories);

        CumulativeWeights weights = CumulativeWeights::projected(eligible.size());
        for (BannerPos pos : eligible) {
            weights.add_weight_for(banners_[pos].total(), pos);
        }
        winner = weights.select(rng);
    }

    if (!winner) return std::nullopt;

    // Lost races surface as nullopt, no retry
    return checked(*winner).show();
}

InventoryStats Inventory::stats() const {
    InventoryStats s;
    s.banners = banners_.size();
    s.categories = index_.category_count();
    s.taggings = index_.total_taggings();
    s.index_bytes = index_.memory_usage();

    for (const auto& banner : banners_) {
        uint32_t left = banner.remaining();
        s.total_impressions += banner.total();
        s.remaining_impressions += left;
        if (left == 0) s.exhausted++;
    }
    return s;
}

} // namespace rotator
