//
//  catalog.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "identity.hpp"
#include "status.hpp"

namespace chaptify {

/// One catalog track; its position in the listing is the chapter order.
struct CatalogTrack {
    uint32_t index = 0;
    std::string name;
    int64_t nominal_duration_ms = 0;  ///< > 0 once validated by the adapter
};

/// A catalog work. `tracks` is empty for search results until fetched.
struct CatalogWork {
    std::string id;
    std::string author;                ///< Display author (all authors, comma-joined)
    std::vector<std::string> authors;  ///< Individual author names
    std::string title;
    std::vector<CatalogTrack> tracks;

    /// Sum of nominal track durations; 0 when no tracks are known.
    int64_t nominal_total_ms() const;
};

/**
 * @brief Catalog capability consumed by the pipeline.
 *
 * Implementations do not retry; they classify failures as CatalogTransient / CatalogNotFound /
 * CatalogUnauthorized / CatalogMalformed and leave retry policy to the caller. Implementations
 * must be callable from several threads at once.
 */
class CatalogClient {
   public:
    virtual ~CatalogClient() = default;

    /// Candidate works in provider relevance order (possibly empty).
    virtual Result<std::vector<CatalogWork>> search(const IdentityKey &key) = 0;

    /// Ordered track listing of a work.
    virtual Result<std::vector<CatalogTrack>> fetch_tracks(const std::string &work_id) = 0;
};

/**
 * @brief Decorator enforcing a minimum interval between catalog calls.
 *
 * One instance is shared by all concurrently running pipelines.
 */
class RateLimitedCatalog : public CatalogClient {
   public:
    RateLimitedCatalog(CatalogClient &inner, std::chrono::milliseconds min_interval);

    Result<std::vector<CatalogWork>> search(const IdentityKey &key) override;
    Result<std::vector<CatalogTrack>> fetch_tracks(const std::string &work_id) override;

   private:
    void acquire();

    CatalogClient &inner_;
    const std::chrono::milliseconds min_interval_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point next_slot_{};
};

}  // namespace chaptify
