/*
 * RunInfo.h
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

#ifndef RUNINFO_H
#define RUNINFO_H

#include "MarketMetrics.h"
#include "SearchOutcome.h"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Class to store run-scoped results for one supply configuration iteration.
 *
 * Each run owns its random stream (seeded from the master seed and the run
 * index) and its own metrics, so runs can execute in any order.
 */
class RunInfo {
public:
    RunInfo() {}
    RunInfo(int run, uint64_t seed) : run(run), seed(seed) {}

    int run{0};                 // supply configuration index, 0-based
    uint64_t seed{0};           // derived seed of this run's stream
    int searches_completed{0};
    bool cancelled{false};      // stopped before search_iterations searches
    double time_spent{0.0};     // seconds, reporting only

    std::vector<SearchOutcome> outcomes; // empty unless outcomes are kept
    MarketMetrics metrics;
    MetricsSummary summary;

    /**
     * Prints a one-line progress report for this run.
     */
    void report() const;

    /**
     * @brief Convert the run info to a JSON string.
     * @return A JSON string with the run's identity and summary.
     */
    std::string to_json() const;
};

#endif // RUNINFO_H
