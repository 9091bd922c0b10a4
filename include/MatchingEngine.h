/*
 * MatchingEngine.h
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

#ifndef MATCHINGENGINE_H
#define MATCHINGENGINE_H

#include "CleanerRegistry.h"
#include "GeoPoint.h"
#include "Market.h"
#include "ProbabilityModel.h"
#include "SearchOutcome.h"
#include <string>

class PCG32;

/**
 * @brief Runs one simulated search against a market and its cleaners.
 *
 * Simulation rules:
 * - The search point is drawn inside the market.
 * - Every eligible cleaner, nearest first, draws once to decide whether it bids.
 * - Bidders, nearest first, draw once more; the first success connects and
 *   no further draws are taken (first acceptor wins, at most one connection).
 * - Market and registry are only read; all variability comes from `rng`.
 */
class MatchingEngine {
public:
    MatchingEngine(const Market& market, const CleanerRegistry& registry,
                   ProbabilityModel model, double search_radius_km);

    /**
     * Samples a search point from the market and simulates the search there.
     */
    SearchOutcome simulate_search(int search_index, PCG32& rng) const;
    /**
     * Simulates a search at a given point.
     */
    SearchOutcome simulate_search_at(int search_index, const GeoPoint& point,
                                     const std::string& postal_code, PCG32& rng) const;

    const ProbabilityModel& get_model() const { return model; }
    double get_search_radius() const { return search_radius_km; }

private:
    const Market& market;
    const CleanerRegistry& registry;
    ProbabilityModel model;
    double search_radius_km;

    /**
     * Clamps a raw probability to [0,1]; negative or NaN input counts as an
     * anomaly on the outcome and is logged.
     */
    double clamp_probability(double raw, const char* what, const std::string& contractor_id,
                             SearchOutcome& outcome) const;
};

#endif // MATCHINGENGINE_H
