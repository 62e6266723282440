#pragma once
// Stats: JSON view of an inventory for the /stats endpoint

#include "inventory.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace rotator {

using json = nlohmann::json;

inline json stats_json(const Inventory& inventory) {
    InventoryStats s = inventory.stats();
    return {
        {"version", version::string()},
        {"banners", s.banners},
        {"exhausted", s.exhausted},
        {"categories", s.categories},
        {"taggings", s.taggings},
        {"impressions", {
            {"total", s.total_impressions},
            {"remaining", s.remaining_impressions},
            {"served", s.total_impressions - s.remaining_impressions}
        }},
        {"index_bytes", s.index_bytes}
    };
}

// Per-banner detail, used by verbose startup logging and tests
inline json banner_json(const Inventory& inventory, BannerPos pos) {
    const Banner& banner = inventory.banner(pos);
    return {
        {"position", pos},
        {"url", banner.url()},
        {"total", banner.total()},
        {"remaining", banner.remaining()},
        {"categories", inventory.index().categories_of(pos)}
    };
}

inline std::string stats_string(const Inventory& inventory, int indent = -1) {
    return stats_json(inventory).dump(indent);
}

} // namespace rotator
