/*
 * Cleaner.h
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

#ifndef CLEANER_H
#define CLEANER_H

#include "GeoPoint.h"
#include <string>

/**
 * @brief The Cleaner class models one service provider in the market.
 *
 * Simulation rules:
 * - A cleaner serves searches inside its own service radius around its location.
 * - Only cleaners with bidding_active can respond to searches.
 * - Quality score and spare capacity (team size vs active connections) feed the
 *   bid and connection probabilities; they do not change during a run.
 */
class Cleaner {
public:
    std::string contractor_id;
    GeoPoint location;
    std::string postal_code;        // empty if unknown
    bool bidding_active{true};
    bool assignment_active{true};
    double cleaner_score{0.5};      // quality in [0,1]
    double service_radius{10.0};    // km
    int team_size{1};
    int active_connections{0};

    Cleaner() {}
    /**
     * Builds and validates a cleaner; throws ValidationError on bad fields.
     */
    Cleaner(std::string id, GeoPoint loc, double score = 0.5, double radius = 10.0,
            bool bidding = true, int team = 1, int connections = 0);

    /**
     * Throws ValidationError if any field is out of range.
     */
    void validate() const;

    double distance_to(const GeoPoint& point) const;
    /**
     * Connections the team can hold at most; may exceed the int range.
     */
    long long max_connections(int per_member) const { return (long long)team_size * per_member; }
    /**
     * Share of capacity in use: active_connections / max_connections.
     */
    double utilization(int per_member) const;
};

#endif // CLEANER_H
