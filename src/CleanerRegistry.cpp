/*
 * CleanerRegistry.cpp
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

#include "CleanerRegistry.h"
#include "Errors.h"
#include "Market.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

CleanerRegistry::CleanerRegistry(std::vector<Cleaner> list) : cleaners(std::move(list)) {
    std::set<std::string> seen;
    for (const Cleaner& c : cleaners) {
        c.validate();
        if (!seen.insert(c.contractor_id).second)
            throw ValidationError("duplicate contractor_id " + c.contractor_id);
    }
}

std::vector<EligibleCleaner> CleanerRegistry::eligible_cleaners(const GeoPoint& point,
                                                                double search_radius_km) const {
    // Simulation rule: every cleaner is tested against the search point with
    // its own service radius; the search radius only caps how far a search looks.
    if (!std::isfinite(search_radius_km) || search_radius_km <= 0.0)
        throw ValidationError("search radius must be positive");

    std::vector<EligibleCleaner> out;
    for (const Cleaner& c : cleaners) {
        if (!c.bidding_active)
            continue;
        double d = c.distance_to(point);
        if (d <= c.service_radius && d <= search_radius_km)
            out.push_back(EligibleCleaner{&c, d});
    }
    std::sort(out.begin(), out.end(), [](const EligibleCleaner& a, const EligibleCleaner& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.cleaner->contractor_id < b.cleaner->contractor_id;
    });
    return out;
}

void CleanerRegistry::check_membership(const Market& market) const {
    for (const Cleaner& c : cleaners) {
        if (market.kind() == MarketKind::PostalCodeBased && !c.postal_code.empty()) {
            if (!market.find_cell(c.postal_code))
                throw ValidationError("cleaner " + c.contractor_id + ": postal code " +
                                      c.postal_code + " not in market " + market.id());
        } else if (!market.contains(c.location)) {
            std::ostringstream oss;
            oss << "cleaner " << c.contractor_id << ": location " << c.location.to_string()
                << " lies outside market " << market.id();
            throw ValidationError(oss.str());
        }
    }
}

const Cleaner* CleanerRegistry::find(const std::string& contractor_id) const {
    for (const Cleaner& c : cleaners) {
        if (c.contractor_id == contractor_id)
            return &c;
    }
    return nullptr;
}

size_t CleanerRegistry::active_count() const {
    return (size_t)std::count_if(cleaners.begin(), cleaners.end(),
                                 [](const Cleaner& c) { return c.bidding_active; });
}
