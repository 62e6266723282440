#pragma once
// Handler: maps HTTP requests onto Inventory::select and stats
//
//   GET /?category=...   banner markup, 204 when nothing is available
//   GET /stats           inventory stats as JSON

#include "http_server.hpp"
#include "inventory.hpp"

namespace rotator {

class Handler {
public:
    Handler(InventoryPtr inventory, Rng rng)
        : inventory_(std::move(inventory))
        , rng_(std::move(rng)) {}

    HttpResponse handle(const HttpRequest& request);

    size_t served() const { return served_; }
    size_t empty() const { return empty_; }

private:
    InventoryPtr inventory_;
    Rng rng_;
    size_t served_ = 0;
    size_t empty_ = 0;
};

} // namespace rotator
