#pragma once
// Banner: one inventory item with an impression budget
//
// url and total are fixed at construction. remaining is the only field
// that changes after load, and only through show(), which decrements it
// with a compare-and-swap loop so any number of threads can deplete the
// same banner without a lock.

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace rotator {

// Position of a banner in the inventory (stable for the store's lifetime)
using BannerPos = uint32_t;

constexpr const char* HTML_PREFIX = "<html><body><img src=\"";
constexpr const char* HTML_SUFFIX = "\"/></body></html>";

// url is inserted verbatim
inline std::string render_html(const std::string& url) {
    std::string out;
    out.reserve(url.size() + 40);
    out += HTML_PREFIX;
    out += url;
    out += HTML_SUFFIX;
    return out;
}

class Banner {
public:
    Banner(std::string url, uint32_t total)
        : url_(std::move(url))
        , total_(total)
        , remaining_(total) {}

    // Owns an atomic, lives in place
    Banner(const Banner&) = delete;
    Banner& operator=(const Banner&) = delete;

    const std::string& url() const { return url_; }
    uint32_t total() const { return total_; }

    uint32_t remaining() const {
        return remaining_.load(std::memory_order_acquire);
    }

    // Best-effort eligibility read; may be stale by the time show() runs
    bool can_show() const {
        return remaining_.load(std::memory_order_relaxed) > 0;
    }

    // Consume one impression. nullopt when the budget is exhausted.
    std::optional<std::string> show() const {
        if (!try_consume()) return std::nullopt;
        return render_html(url_);
    }

    // Decrement-if-positive
    bool try_consume() const {
        uint32_t current = remaining_.load(std::memory_order_acquire);
        do {
            if (current == 0) return false;
        } while (!remaining_.compare_exchange_weak(
            current, current - 1,
            std::memory_order_acq_rel, std::memory_order_acquire));
        return true;
    }

private:
    std::string url_;
    uint32_t total_;
    mutable std::atomic<uint32_t> remaining_;
};

} // namespace rotator
