#pragma once
// Category Index: inverted index from category key to banner positions
//
// Architecture:
//   - String interning: each unique category stored once, referenced by id
//   - Inverted index: category id -> RoaringBitmap of banner positions
//   - Forward index: banner position -> [category ids] (for stats/debug)
//
// Built once during the single-threaded load phase, then frozen. A frozen
// index is only read, so lookups take no lock. Banner positions are
// append-only, which makes the ascending bitmap order equal to load order.

#include "banner.hpp"
#include "log.hpp"
#include <roaring/roaring.h>
#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace rotator {

class CategoryIndex {
public:
    CategoryIndex() = default;
    ~CategoryIndex() { clear(); }

    CategoryIndex(const CategoryIndex&) = delete;
    CategoryIndex& operator=(const CategoryIndex&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Build phase
    // ═══════════════════════════════════════════════════════════════════════

    // Tag banner position with category. Repeats are no-ops.
    void add(BannerPos pos, const std::string& category) {
        if (frozen_) {
            fatal("index", "add() after freeze()");
        }
        uint32_t id = intern(category);
        if (!roaring_bitmap_add_checked(postings_[id], pos)) return;

        if (pos >= forward_.size()) {
            forward_.resize(pos + 1);
        }
        forward_[pos].push_back(id);
    }

    void add(BannerPos pos, const std::vector<std::string>& categories) {
        for (const auto& category : categories) {
            add(pos, category);
        }
    }

    // Compact postings and stop accepting writes
    void freeze() {
        for (auto* bitmap : postings_) {
            roaring_bitmap_run_optimize(bitmap);
            roaring_bitmap_shrink_to_fit(bitmap);
        }
        forward_.shrink_to_fit();
        frozen_ = true;
    }

    bool frozen() const { return frozen_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Query Operations
    // ═══════════════════════════════════════════════════════════════════════

    bool contains(const std::string& category) const {
        return string_to_id_.find(category) != string_to_id_.end();
    }

    // Positions tagged with category, ascending
    std::vector<BannerPos> positions(const std::string& category) const {
        auto it = string_to_id_.find(category);
        if (it == string_to_id_.end()) return {};
        return bitmap_to_vector(postings_[it->second]);
    }

    // Union of the postings of every known category, deduplicated and
    // ascending. Unknown categories contribute nothing.
    std::vector<BannerPos> candidates(const std::vector<std::string>& categories) const {
        std::vector<const roaring_bitmap_t*> hits;
        hits.reserve(categories.size());
        for (const auto& category : categories) {
            auto it = string_to_id_.find(category);
            if (it != string_to_id_.end()) {
                hits.push_back(postings_[it->second]);
            }
        }

        if (hits.empty()) return {};
        if (hits.size() == 1) return bitmap_to_vector(hits[0]);

        roaring_bitmap_t* merged = roaring_bitmap_or_many(hits.size(), hits.data());
        std::vector<BannerPos> result = bitmap_to_vector(merged);
        roaring_bitmap_free(merged);
        return result;
    }

    // Categories of one banner, in the order they were first added
    std::vector<std::string> categories_of(BannerPos pos) const {
        std::vector<std::string> result;
        if (pos >= forward_.size()) return result;

        result.reserve(forward_[pos].size());
        for (uint32_t id : forward_[pos]) {
            result.push_back(id_to_string_[id]);
        }
        return result;
    }

    // Largest indexed position + 1 (0 when empty)
    size_t position_bound() const {
        size_t bound = 0;
        for (const auto* bitmap : postings_) {
            if (!roaring_bitmap_is_empty(bitmap)) {
                bound = std::max<size_t>(bound, size_t(roaring_bitmap_maximum(bitmap)) + 1);
            }
        }
        return bound;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    size_t category_count() const {
        return id_to_string_.size();
    }

    size_t total_taggings() const {
        size_t total = 0;
        for (const auto* bitmap : postings_) {
            total += roaring_bitmap_get_cardinality(bitmap);
        }
        return total;
    }

    size_t memory_usage() const {
        size_t bytes = 0;

        // String table
        for (const auto& s : id_to_string_) {
            bytes += s.size() + sizeof(std::string);
        }

        // Hash table overhead
        bytes += string_to_id_.size() * (sizeof(std::string) + sizeof(uint32_t) + 32);

        // Roaring bitmaps
        for (const auto* bitmap : postings_) {
            bytes += roaring_bitmap_size_in_bytes(bitmap);
        }

        // Forward index
        for (const auto& ids : forward_) {
            bytes += ids.capacity() * sizeof(uint32_t);
        }

        return bytes;
    }

private:
    // Intern a category string, returns category id
    uint32_t intern(const std::string& category) {
        auto it = string_to_id_.find(category);
        if (it != string_to_id_.end()) {
            return it->second;
        }

        uint32_t id = static_cast<uint32_t>(id_to_string_.size());
        string_to_id_.emplace(category, id);
        id_to_string_.push_back(category);
        postings_.push_back(roaring_bitmap_create());
        return id;
    }

    void clear() {
        for (auto* bitmap : postings_) {
            roaring_bitmap_free(bitmap);
        }
        postings_.clear();
        string_to_id_.clear();
        id_to_string_.clear();
        forward_.clear();
    }

    static std::vector<BannerPos> bitmap_to_vector(const roaring_bitmap_t* bitmap) {
        uint64_t card = roaring_bitmap_get_cardinality(bitmap);
        std::vector<BannerPos> result(card);
        roaring_bitmap_to_uint32_array(bitmap, result.data());
        return result;
    }

    bool frozen_ = false;

    // String interning
    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;

    // Inverted index: category id -> banner positions
    std::vector<roaring_bitmap_t*> postings_;

    // Forward index: banner position -> category ids
    std::vector<std::vector<uint32_t>> forward_;
};

} // namespace rotator
