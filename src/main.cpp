// marketsim: simulates searches against the cleaner supply of one market.
//
// Reads postal_codes.csv and cleaners.csv from --data-dir, runs the
// simulation and writes simulation_summary.json and search_results.csv.
//
// Run: ./marketsim --type=location --data-dir=data --market-id=nyc \
//          --center-lat=40.75 --center-lon=-73.99 --market-radius=5
// --------------------------------------------------------------------

#include "CleanerRegistry.h"
#include "CliOptions.h"
#include "DataLoader.h"
#include "Errors.h"
#include "Logger.h"
#include "Market.h"
#include "Simulation.h"
#include "SimulationSerializer.h"
#include <cstdio>
#include <filesystem>

// -------------------------
// Entry point
// -------------------------
int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = CliOptions::from_args(argc, argv);
    } catch (const ValidationError& e) {
        std::fprintf(stderr, "%s\n", e.what());
        CliOptions::print_help(argv[0]);
        return 1;
    }
    if (options.help) {
        CliOptions::print_help(argv[0]);
        return 0;
    }
    if (options.quiet)
        Logger::global().set_threshold(LogLevel::Warn);

    try {
        DataLoader loader(options.data_dir);
        Market market = options.type == "postal_code"
            ? loader.load_postal_market(options.market_id, options.config.cell_jitter_km)
            : Market::location_based(options.market_id,
                                     GeoPoint(options.center_lat, options.center_lon),
                                     options.market_radius);
        CleanerRegistry registry(loader.load_cleaners());

        Simulation sim(std::move(market), std::move(registry), options.config);
        sim.set_report(!options.quiet);
        if (!sim.run_all()) {
            std::fprintf(stderr, "Simulation failed: %s\n", sim.failure_cause().c_str());
            return 1;
        }

        std::filesystem::create_directories(options.output_dir);
        SimulationSerializer::save(sim.get_market(), sim.result(), options.output_dir);

        const MetricsSummary& s = sim.result().summary;
        std::printf("\nSimulation complete. Summary statistics:\n");
        std::printf("--------------------------------------------------\n");
        std::printf("cleaners: %zu (%zu bidding)\n", sim.get_registry().size(),
                    sim.get_registry().active_count());
        std::printf("cleaners offered / bidding: %lld / %lld\n", s.number_of_cleaners,
                    s.number_of_active_cleaners);
        std::printf("avg_service_radius: %.3f\n", s.avg_service_radius);
        std::printf("searches: %lld\n", s.searches);
        std::printf("connection_rate: %.3f\n", s.connection_rate);
        std::printf("coverage_ratio: %.3f\n", s.coverage_ratio);
        std::printf("search_density: %.3f\n", s.search_density);
        std::printf("offers_per_search p25/p50/p75: %.1f / %.1f / %.1f\n", s.offers_per_search.p25,
                    s.offers_per_search.p50, s.offers_per_search.p75);
        std::printf("avg_bids_per_search: %.3f\n", s.avg_bids_per_search);
        std::printf("avg_connections_per_search: %.3f\n", s.avg_connections_per_search);
        std::printf("avg_connection_distance: %.3f\n", s.connection_distance.mean);
        std::printf("avg_connection_score: %.3f\n", s.connection_score.mean);
        if (sim.result().sampled_coverage)
            std::printf("sampled_coverage: %.3f\n", *sim.result().sampled_coverage);
        std::printf("\nResults saved to: %s\n", options.output_dir.c_str());
    } catch (const std::exception& e) {
        Logger::error("main", e.what());
        return 1;
    }
    return 0;
}
