/*
 * Simulation.h
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

#ifndef SIMULATION_H
#define SIMULATION_H

#include "CleanerRegistry.h"
#include "Market.h"
#include "ProbabilityModel.h"
#include "RunInfo.h"
#include "SimulationConfig.h"
#include "SimulationResult.h"
#include <atomic>
#include <optional>
#include <string>

enum class SimulationState { Configured, Running, Completed, Failed };

const char* to_string(SimulationState state);

/**
 * @brief The Simulation class drives repeated search simulations over one market.
 *
 * Simulation rules:
 * - Inputs are validated before any search runs; a validation or empty-market
 *   error moves the simulation to Failed and no result is produced.
 * - Each supply configuration iteration runs search_iterations searches in
 *   sequence on one PCG32 stream seeded from (random_seed, run index).
 * - Results depend only on (market, cleaners, config, seed), not on how many
 *   worker threads execute the runs.
 * - A stop request is honoured between searches; the result is then partial
 *   but still valid, and flagged as cancelled.
 */
class Simulation {
public:
    /**
     * Constructor takes a snapshot of the market, the cleaners and the parameters.
     */
    Simulation(Market market, CleanerRegistry registry, SimulationConfig config = SimulationConfig());

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * Replaces the bid/connection model built from the config. Only allowed
     * before run_all().
     */
    void set_probability_model(ProbabilityModel model);

    /**
     * Prints a report line per run when enabled.
     */
    void set_report(bool enabled) { report_runs = enabled; }

    /**
     * Runs all supply configuration iterations. Returns true when the
     * simulation completed. Throws std::logic_error if called twice.
     */
    bool run_all();

    /**
     * Asks running workers to stop after their current search. Thread safe.
     */
    void request_stop() { stop_requested = true; }

    /**
     * Searches finished so far across all runs. Thread safe.
     */
    long long searches_completed() const { return completed_searches.load(); }

    SimulationState get_state() const { return state; }
    const std::string& failure_cause() const { return failure; }

    /**
     * The finalized result; throws std::logic_error unless Completed.
     */
    const SimulationResult& result() const;

    const Market& get_market() const { return market; }
    const CleanerRegistry& get_registry() const { return registry; }

private:
    Market market;
    CleanerRegistry registry;
    SimulationConfig config;
    ProbabilityModel model;
    bool report_runs{false};

    SimulationState state{SimulationState::Configured};
    std::string failure;
    std::optional<SimulationResult> outcome;

    std::atomic<bool> stop_requested{false};
    std::atomic<long long> completed_searches{0};

    /**
     * Validation phase: parameters, market, cleaners, then emptiness.
     */
    void validate_inputs() const;
    /**
     * Executes one supply configuration iteration on its own stream.
     */
    void run_one(RunInfo& runInfo);
    /**
     * Runs every iteration, on max_workers threads when more than one.
     */
    void run_iterations(std::vector<RunInfo>& runs);
    /**
     * Merges the runs into the final result.
     */
    SimulationResult finalize(std::vector<RunInfo> runs) const;
    void fail(const std::string& cause);
};

#endif // SIMULATION_H
