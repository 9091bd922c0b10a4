/*
 * Cleaner.cpp
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

#include "Cleaner.h"
#include "Errors.h"
#include <cmath>
#include <utility>

Cleaner::Cleaner(std::string id, GeoPoint loc, double score, double radius,
                 bool bidding, int team, int connections)
    : contractor_id(std::move(id)), location(loc), bidding_active(bidding),
      cleaner_score(score), service_radius(radius), team_size(team),
      active_connections(connections) {
    validate();
}

void Cleaner::validate() const {
    if (contractor_id.empty())
        throw ValidationError("cleaner: contractor_id must not be empty");
    location.validate("cleaner " + contractor_id);
    if (!std::isfinite(cleaner_score) || cleaner_score < 0.0 || cleaner_score > 1.0)
        throw ValidationError("cleaner " + contractor_id + ": cleaner_score must be between 0 and 1");
    if (!std::isfinite(service_radius) || service_radius <= 0.0)
        throw ValidationError("cleaner " + contractor_id + ": service_radius must be positive");
    if (team_size < 1)
        throw ValidationError("cleaner " + contractor_id + ": team_size must be at least 1");
    if (active_connections < 0)
        throw ValidationError("cleaner " + contractor_id + ": active_connections cannot be negative");
}

double Cleaner::distance_to(const GeoPoint& point) const {
    return geo::distance_km(location, point);
}

double Cleaner::utilization(int per_member) const {
    long long cap = max_connections(per_member);
    if (cap <= 0)
        return 1.0;
    return (double)active_connections / (double)cap;
}

