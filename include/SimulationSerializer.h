#ifndef SIMULATION_SERIALIZER_H
#define SIMULATION_SERIALIZER_H

#include "Market.h"
#include "SimulationResult.h"
#include <ostream>
#include <string>

class SimulationSerializer {
public:
    /**
     * Serializes the configuration, the market and the summaries (overall
     * and per run) as JSON.
     */
    static void serialize(const Market& market, const SimulationResult& result, std::ostream& out);

    /**
     * Writes one CSV row per kept search outcome (search_results.csv layout).
     */
    static void write_search_results(const SimulationResult& result, std::ostream& out);

    /**
     * Writes simulation_summary.json and search_results.csv into `directory`.
     * Throws std::runtime_error if a file cannot be written.
     */
    static void save(const Market& market, const SimulationResult& result, const std::string& directory);
};

#endif // SIMULATION_SERIALIZER_H
