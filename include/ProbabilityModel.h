/*
 * ProbabilityModel.h
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

#ifndef PROBABILITYMODEL_H
#define PROBABILITYMODEL_H

#include <functional>

class Cleaner;
class SimulationConfig;

/**
 * Quality adjustment: 1 + weight * (score - 0.5).
 * Neutral for an average cleaner (score 0.5), rising linearly with score.
 */
std::function<double(double)> make_quality_adjustment(double weight);

/**
 * Capacity adjustment: 1 - active_connections / (team_size * per_member),
 * never below `floor` so a saturated team still bids occasionally.
 */
std::function<double(const Cleaner&)> make_capacity_adjustment(int per_member, double floor);

/**
 * @brief Bid and connection probabilities for a cleaner at a given distance.
 *
 * Simulation rules:
 * - p_bid  = base_bid  * exp(-decay * d) * quality(score) * capacity(cleaner)
 * - p_conn = base_conn * exp(-decay * d) * quality(score)
 * - The raw products are returned unclamped; the matching engine clamps them
 *   to [0,1] and treats a negative or NaN value as an anomaly.
 *
 * The two adjustment curves are plain functions so they can be swapped
 * without touching the matching algorithm.
 */
class ProbabilityModel {
public:
    double base_bid_probability{0.14};
    double base_connection_probability{0.4};
    double distance_decay_factor{0.2};
    std::function<double(double)> quality_adjustment;
    std::function<double(const Cleaner&)> capacity_adjustment;

    ProbabilityModel();
    /**
     * Model with the configured rates and the default adjustment curves.
     */
    explicit ProbabilityModel(const SimulationConfig& config);

    double distance_factor(double distance) const;
    double raw_bid_probability(const Cleaner& cleaner, double distance) const;
    double raw_connection_probability(const Cleaner& cleaner, double distance) const;
};

#endif // PROBABILITYMODEL_H
