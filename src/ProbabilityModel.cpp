/*
 * ProbabilityModel.cpp
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

#include "ProbabilityModel.h"
#include "Cleaner.h"
#include "SimulationConfig.h"
#include <algorithm>
#include <cmath>

std::function<double(double)> make_quality_adjustment(double weight) {
    return [weight](double score) -> double {
        return 1.0 + weight * (score - 0.5);
    };
}

std::function<double(const Cleaner&)> make_capacity_adjustment(int per_member, double floor) {
    return [per_member, floor](const Cleaner& cleaner) -> double {
        return std::max(floor, 1.0 - cleaner.utilization(per_member));
    };
}

ProbabilityModel::ProbabilityModel()
    : quality_adjustment(make_quality_adjustment(1.0)),
      capacity_adjustment(make_capacity_adjustment(10, 0.1)) {}

ProbabilityModel::ProbabilityModel(const SimulationConfig& config)
    : base_bid_probability(config.cleaner_base_bid_probability),
      base_connection_probability(config.connection_base_probability),
      distance_decay_factor(config.distance_decay_factor),
      quality_adjustment(make_quality_adjustment(config.quality_weight)),
      capacity_adjustment(make_capacity_adjustment(config.max_connections_per_member,
                                                   config.min_capacity_factor)) {}

double ProbabilityModel::distance_factor(double distance) const {
    return std::exp(-distance_decay_factor * distance);
}

double ProbabilityModel::raw_bid_probability(const Cleaner& cleaner, double distance) const {
    return base_bid_probability * distance_factor(distance) *
           quality_adjustment(cleaner.cleaner_score) * capacity_adjustment(cleaner);
}

double ProbabilityModel::raw_connection_probability(const Cleaner& cleaner, double distance) const {
    return base_connection_probability * distance_factor(distance) *
           quality_adjustment(cleaner.cleaner_score);
}
