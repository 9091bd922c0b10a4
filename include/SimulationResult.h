/*
 * SimulationResult.h
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

#ifndef SIMULATIONRESULT_H
#define SIMULATIONRESULT_H

#include "MarketMetrics.h"
#include "RunInfo.h"
#include "SimulationConfig.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Finalized output of a completed simulation.
 *
 * Read-only for the serializer and any other presentation layer.
 */
struct SimulationResult {
    std::string market_id;
    double total_area{0.0};            // km2
    SimulationConfig config;
    std::vector<RunInfo> runs;         // ordered by run index
    MarketMetrics metrics;             // all runs merged
    MetricsSummary summary;
    std::optional<double> sampled_coverage; // set when coverage_samples > 0
    bool cancelled{false};

    long long total_searches() const { return summary.searches; }
};

#endif // SIMULATIONRESULT_H
