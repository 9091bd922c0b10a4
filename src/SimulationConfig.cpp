/*
 * SimulationConfig.cpp
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

#include "SimulationConfig.h"
#include "Errors.h"
#include "JsonText.h"
#include <cmath>
#include <sstream>

static void require(bool ok, const char* message) {
    if (!ok)
        throw ValidationError(std::string("config: ") + message);
}

static bool is_probability(double p) {
    return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

void SimulationConfig::validate() const {
    require(search_iterations > 0, "search_iterations must be positive");
    require(supply_configuration_iterations > 0, "supply_configuration_iterations must be positive");
    require(is_probability(cleaner_base_bid_probability),
            "cleaner_base_bid_probability must be between 0 and 1");
    require(is_probability(connection_base_probability),
            "connection_base_probability must be between 0 and 1");
    require(std::isfinite(distance_decay_factor) && distance_decay_factor >= 0.0,
            "distance_decay_factor must be non-negative");
    require(std::isfinite(search_radius_km) && search_radius_km > 0.0,
            "search_radius_km must be positive");
    require(std::isfinite(quality_weight) && quality_weight >= 0.0 && quality_weight <= 2.0,
            "quality_weight must be between 0 and 2");
    require(max_connections_per_member > 0, "max_connections_per_member must be positive");
    require(std::isfinite(min_capacity_factor) && min_capacity_factor > 0.0 && min_capacity_factor <= 1.0,
            "min_capacity_factor must be in (0, 1]");
    require(std::isfinite(cell_jitter_km) && cell_jitter_km >= 0.0, "cell_jitter_km cannot be negative");
    require(coverage_samples >= 0, "coverage_samples cannot be negative");
    require(max_workers >= 1, "max_workers must be at least 1");
}

std::string SimulationConfig::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"search_iterations\":" << search_iterations << ",";
    oss << "\"supply_configuration_iterations\":" << supply_configuration_iterations << ",";
    oss << "\"random_seed\":" << random_seed << ",";
    oss << "\"cleaner_base_bid_probability\":" << json_number(cleaner_base_bid_probability) << ",";
    oss << "\"connection_base_probability\":" << json_number(connection_base_probability) << ",";
    oss << "\"distance_decay_factor\":" << json_number(distance_decay_factor) << ",";
    oss << "\"search_radius_km\":" << json_number(search_radius_km) << ",";
    oss << "\"quality_weight\":" << json_number(quality_weight) << ",";
    oss << "\"max_connections_per_member\":" << max_connections_per_member << ",";
    oss << "\"min_capacity_factor\":" << json_number(min_capacity_factor) << ",";
    oss << "\"cell_jitter_km\":" << json_number(cell_jitter_km) << ",";
    oss << "\"coverage_samples\":" << coverage_samples << ",";
    oss << "\"max_workers\":" << max_workers << ",";
    oss << "\"keep_outcomes\":" << (keep_outcomes ? "true" : "false") << ",";
    oss << "\"require_membership\":" << (require_membership ? "true" : "false");
    oss << "}";
    return oss.str();
}
