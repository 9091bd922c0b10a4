/*
 * Simulation.cpp
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

#include "Simulation.h"
#include "Errors.h"
#include "Logger.h"
#include "MatchingEngine.h"
#include "PCG32.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

// Stream ids: search streams use the run index, coverage probes their own id
// so they never share draws with a search stream.
static constexpr uint64_t COVERAGE_STREAM = 0xC0FFEEULL;

const char* to_string(SimulationState state) {
    switch (state) {
    case SimulationState::Configured: return "Configured";
    case SimulationState::Running:    return "Running";
    case SimulationState::Completed:  return "Completed";
    case SimulationState::Failed:     return "Failed";
    }
    return "?";
}

Simulation::Simulation(Market market, CleanerRegistry registry, SimulationConfig config)
    : market(std::move(market)), registry(std::move(registry)), config(config), model(config) {}

void Simulation::set_probability_model(ProbabilityModel m) {
    if (state != SimulationState::Configured)
        throw std::logic_error("probability model can only be replaced before the simulation runs");
    model = std::move(m);
}

bool Simulation::run_all() {
    // Main simulation loop: validates, runs all supply configurations, finalizes.
    if (state != SimulationState::Configured)
        throw std::logic_error(std::string("simulation cannot run from state ") + to_string(state));

    try {
        validate_inputs();
    } catch (const ValidationError& e) {
        fail(std::string("validation error: ") + e.what());
        return false;
    } catch (const EmptyMarketError& e) {
        fail(std::string("empty market: ") + e.what());
        return false;
    }

    state = SimulationState::Running;
    {
        std::ostringstream oss;
        oss << "market " << market.id() << ": " << config.supply_configuration_iterations
            << " supply configuration(s) x " << config.search_iterations << " searches, "
            << registry.size() << " cleaners (" << registry.active_count() << " bidding), seed "
            << config.random_seed;
        Logger::info("simulation", oss.str());
    }

    std::vector<RunInfo> runs;
    runs.reserve((size_t)config.supply_configuration_iterations);
    for (int i = 0; i < config.supply_configuration_iterations; ++i)
        runs.emplace_back(i, PCG32::derive_seed(config.random_seed, (uint64_t)i));

    if (report_runs) {
        std::printf("  Run Searches  Connect     Rate Coverage  Bids/Sr    Time\n");
    }

    try {
        run_iterations(runs);
        outcome = finalize(std::move(runs));
    } catch (const std::exception& e) {
        fail(e.what());
        return false;
    }

    state = SimulationState::Completed;
    std::ostringstream oss;
    oss << "market " << market.id() << ": " << outcome->summary.searches << " searches, connection rate "
        << outcome->summary.connection_rate << ", coverage " << outcome->summary.coverage_ratio;
    if (outcome->cancelled)
        oss << " (stopped early)";
    Logger::info("simulation", oss.str());
    if (outcome->summary.anomalies > 0) {
        std::ostringstream w;
        w << outcome->summary.anomalies << " probabilities were clamped during the run";
        Logger::warn("simulation", w.str());
    }
    return true;
}

const SimulationResult& Simulation::result() const {
    if (state != SimulationState::Completed || !outcome)
        throw std::logic_error(std::string("no simulation result in state ") + to_string(state));
    return *outcome;
}

void Simulation::validate_inputs() const {
    config.validate();
    if (!model.quality_adjustment || !model.capacity_adjustment)
        throw ValidationError("probability model is missing an adjustment function");
    if (registry.empty())
        throw EmptyMarketError("market " + market.id() + " has no cleaners");
    if (!(market.total_area() > 0.0))
        throw EmptyMarketError("market " + market.id() + " has no area");
    if (config.require_membership)
        registry.check_membership(market);
}

void Simulation::run_iterations(std::vector<RunInfo>& runs) {
    int workers = std::min(config.max_workers, (int)runs.size());
    if (workers <= 1) {
        for (RunInfo& runInfo : runs)
            run_one(runInfo);
        return;
    }

    // Each worker claims the next run index; every run writes only its own slot.
    std::atomic<size_t> next{0};
    std::vector<std::exception_ptr> errors(runs.size());
    std::vector<std::thread> pool;
    pool.reserve((size_t)workers);
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back([this, &runs, &next, &errors]() {
            for (size_t i = next++; i < runs.size(); i = next++) {
                try {
                    run_one(runs[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }
        });
    }
    for (std::thread& t : pool)
        t.join();
    for (const std::exception_ptr& e : errors) {
        if (e)
            std::rethrow_exception(e);
    }
}

void Simulation::run_one(RunInfo& runInfo) {
    // Simulation rule: one stream per run, never reseeded between searches.
    PCG32 rng(runInfo.seed, (uint64_t)runInfo.run);
    MatchingEngine engine(market, registry, model, config.search_radius_km);

    auto begin = std::chrono::steady_clock::now();
    if (config.keep_outcomes)
        runInfo.outcomes.reserve((size_t)config.search_iterations);

    for (int s = 0; s < config.search_iterations; ++s) {
        if (stop_requested.load()) {
            runInfo.cancelled = true;
            break;
        }
        SearchOutcome result = engine.simulate_search(s, rng);
        runInfo.metrics.add(result);
        if (config.keep_outcomes)
            runInfo.outcomes.push_back(std::move(result));
        ++runInfo.searches_completed;
        ++completed_searches;
    }

    runInfo.summary = runInfo.metrics.summarize(market.total_area());
    runInfo.summary.avg_service_radius = average_service_radius(registry);
    runInfo.time_spent = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    std::ostringstream oss;
    oss << "run " << runInfo.run << " finished " << runInfo.searches_completed << " searches in "
        << runInfo.time_spent << "s";
    Logger::debug("simulation", oss.str());
    if (report_runs)
        runInfo.report();
}

SimulationResult Simulation::finalize(std::vector<RunInfo> runs) const {
    SimulationResult res;
    res.market_id = market.id();
    res.total_area = market.total_area();
    res.config = config;
    for (const RunInfo& runInfo : runs) {
        res.metrics.merge(runInfo.metrics);
        if (runInfo.cancelled)
            res.cancelled = true;
    }
    res.summary = res.metrics.summarize(res.total_area);
    res.summary.avg_service_radius = average_service_radius(registry);
    res.runs = std::move(runs);

    if (config.coverage_samples > 0) {
        PCG32 rng(PCG32::derive_seed(config.random_seed, COVERAGE_STREAM), COVERAGE_STREAM);
        res.sampled_coverage = estimate_coverage(market, registry, config.search_radius_km,
                                                 config.coverage_samples, rng);
    }
    return res;
}

void Simulation::fail(const std::string& cause) {
    state = SimulationState::Failed;
    failure = cause;
    outcome.reset();
    Logger::error("simulation", "market " + market.id() + " failed: " + cause);
}
