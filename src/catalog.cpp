//
//  catalog.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "catalog.hpp"

#include <algorithm>
#include <limits>
#include <thread>

#include "logging.hpp"

namespace chaptify {

int64_t CatalogWork::nominal_total_ms() const {
    int64_t total = 0;
    for (const auto &t : tracks) {
        // Saturate; the resolver rejects totals that do not fit.
        if (t.nominal_duration_ms > std::numeric_limits<int64_t>::max() - total) {
            return std::numeric_limits<int64_t>::max();
        }
        total += t.nominal_duration_ms;
    }
    return total;
}

RateLimitedCatalog::RateLimitedCatalog(CatalogClient &inner,
                                       std::chrono::milliseconds min_interval)
    : inner_(inner), min_interval_(min_interval) {}

void RateLimitedCatalog::acquire() {
    std::chrono::steady_clock::time_point slot;
    {
        // Reserve the next slot under the lock, sleep outside of it.
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        slot = std::max(now, next_slot_);
        next_slot_ = slot + min_interval_;
    }
    const auto now = std::chrono::steady_clock::now();
    if (slot > now) {
        CY_LOG("catalog", "rate limit: waiting "
                              << std::chrono::duration_cast<std::chrono::milliseconds>(slot - now)
                                     .count()
                              << "ms");
        std::this_thread::sleep_until(slot);
    }
}

Result<std::vector<CatalogWork>> RateLimitedCatalog::search(const IdentityKey &key) {
    acquire();
    return inner_.search(key);
}

Result<std::vector<CatalogTrack>> RateLimitedCatalog::fetch_tracks(const std::string &work_id) {
    acquire();
    return inner_.fetch_tracks(work_id);
}

}  // namespace chaptify
