/*
 * SimulationConfig.h
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

#ifndef SIMULATIONCONFIG_H
#define SIMULATIONCONFIG_H

#include <cstdint>
#include <string>

/**
 * @brief Class to store simulation level parameters.
 *
 * Defaults follow the observed marketplace rates (14% of offers get a bid,
 * 40% of bids convert).
 */
class SimulationConfig {
public:
    int search_iterations;                // searches per supply configuration
    int supply_configuration_iterations;  // independent repeats of the whole run
    uint64_t random_seed;                 // master seed
    double cleaner_base_bid_probability;  // bid probability before adjustments
    double connection_base_probability;   // connection probability before adjustments
    double distance_decay_factor;         // per km, exp(-decay * distance)
    double search_radius_km;              // how far a search looks at most
    double quality_weight;                // slope of the quality adjustment
    int max_connections_per_member;       // capacity of one team member
    double min_capacity_factor;           // floor of the capacity adjustment
    double cell_jitter_km;                // spread around cells with no area
    int coverage_samples;                 // grid-free coverage probes, 0 = off
    int max_workers;                      // threads across supply configurations
    bool keep_outcomes;                   // retain every SearchOutcome in the result
    bool require_membership;              // cleaners must lie inside the market

    /**
     * @brief Default constructor with default values.
     */
    SimulationConfig()
        : search_iterations(100), supply_configuration_iterations(1), random_seed(42),
          cleaner_base_bid_probability(0.14), connection_base_probability(0.4),
          distance_decay_factor(0.2), search_radius_km(10.0), quality_weight(1.0),
          max_connections_per_member(10), min_capacity_factor(0.1), cell_jitter_km(1.0),
          coverage_samples(0), max_workers(1), keep_outcomes(true), require_membership(true) {}

    /**
     * @brief Throws ValidationError naming the first out-of-range parameter.
     */
    void validate() const;

    /**
     * @brief Total number of searches across all supply configurations.
     */
    long long total_iterations() const {
        return (long long)search_iterations * supply_configuration_iterations;
    }

    /**
     * @brief Convert the simulation config to a JSON string.
     * @return A JSON string representation of the simulation parameters.
     */
    std::string to_json() const;
};

#endif // SIMULATIONCONFIG_H
