/*
 * CleanerRegistry.h
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef CLEANERREGISTRY_H
#define CLEANERREGISTRY_H

#include "Cleaner.h"
#include "GeoPoint.h"
#include <cstddef>
#include <string>
#include <vector>

class Market;

/**
 * @brief A cleaner that can reach a search point, with the distance used.
 */
struct EligibleCleaner {
    const Cleaner* cleaner{nullptr};
    double distance{0.0};
};

/**
 * @brief Read-only snapshot of the supply side of a market.
 *
 * Simulation rules:
 * - Eligibility is decided per cleaner: the search point must lie inside that
 *   cleaner's own service radius AND inside the search radius cap.
 * - Inactive cleaners (bidding_active == false) are never eligible.
 * - Results are ordered by distance, ties broken by contractor id.
 */
class CleanerRegistry {
public:
    CleanerRegistry() {}
    /**
     * Validates every cleaner and rejects duplicate contractor ids.
     */
    explicit CleanerRegistry(std::vector<Cleaner> cleaners);

    /**
     * Cleaners able to serve `point`; empty when nobody reaches it.
     * Throws ValidationError if search_radius_km is not positive.
     */
    std::vector<EligibleCleaner> eligible_cleaners(const GeoPoint& point, double search_radius_km) const;

    /**
     * Checks every cleaner belongs to the market: a known postal code for
     * postal markets, a location inside the circle for location markets.
     */
    void check_membership(const Market& market) const;

    const Cleaner* find(const std::string& contractor_id) const;

    size_t size() const { return cleaners.size(); }
    bool empty() const { return cleaners.empty(); }
    size_t active_count() const;

    std::vector<Cleaner>::const_iterator begin() const { return cleaners.begin(); }
    std::vector<Cleaner>::const_iterator end() const { return cleaners.end(); }
    const std::vector<Cleaner>& all() const { return cleaners; }

private:
    std::vector<Cleaner> cleaners;
};

#endif // CLEANERREGISTRY_H
