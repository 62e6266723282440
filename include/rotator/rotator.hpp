#pragma once
// Rotator: in-memory banner inventory
//
// - Banner: impression budget with lock-free depletion
// - CumulativeWeights: O(log N) weighted random pick
// - CategoryIndex: category -> banner positions (roaring bitmaps)
// - Inventory: load-time insertion, concurrent selection
// - ConfigLoader / Query / HttpServer: I/O around the inventory

#include "version.hpp"
#include "log.hpp"
#include "banner.hpp"
#include "cumulative_weights.hpp"
#include "category_index.hpp"
#include "inventory.hpp"
#include "config_loader.hpp"
#include "query.hpp"
#include "stats.hpp"
