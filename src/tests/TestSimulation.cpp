#include "Errors.h"
#include "Simulation.h"
#include "SimulationSerializer.h"
#include "TestSupport.h"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace {

Market midtown_market(double radius = 5.0) {
    return Market::location_based("nyc", MIDTOWN, radius);
}

CleanerRegistry central_cleaner(double radius = 10.0, double score = 0.9) {
    return CleanerRegistry({make_cleaner("c1", MIDTOWN, radius, score)});
}

// A handful of cleaners spread over the market.
CleanerRegistry spread_cleaners() {
    std::vector<Cleaner> list;
    for (int i = 0; i < 6; ++i) {
        list.push_back(make_cleaner("c" + std::to_string(i),
                                    geo::destination(MIDTOWN, i * 1.1, 0.7 * i), 3.0, 0.3 + 0.1 * i));
    }
    return CleanerRegistry(list);
}

SimulationConfig certain_config() {
    SimulationConfig config;
    config.search_iterations = 50;
    config.cleaner_base_bid_probability = 1.0;
    config.connection_base_probability = 1.0;
    config.distance_decay_factor = 0.0;
    return config;
}

std::string serialized(const Simulation& sim) {
    std::ostringstream out;
    SimulationSerializer::serialize(sim.get_market(), sim.result(), out);
    return out.str();
}

class SimulationTest : public ::testing::Test {
protected:
    CapturedLog log{LogLevel::Warn};
};

} // namespace

TEST_F(SimulationTest, CertainCleanerGivesFullConnectionRate) {
    Simulation sim(midtown_market(), central_cleaner(), certain_config());
    EXPECT_EQ(sim.get_state(), SimulationState::Configured);
    ASSERT_TRUE(sim.run_all());
    EXPECT_EQ(sim.get_state(), SimulationState::Completed);

    const SimulationResult& r = sim.result();
    EXPECT_EQ(r.total_searches(), 50);
    EXPECT_EQ(r.summary.connections, 50);
    EXPECT_DOUBLE_EQ(r.summary.connection_rate, 1.0);
    EXPECT_DOUBLE_EQ(r.summary.coverage_ratio, 1.0);
    EXPECT_FALSE(r.cancelled);
    EXPECT_EQ(sim.searches_completed(), 50);
    EXPECT_EQ(r.market_id, "nyc");
    EXPECT_DOUBLE_EQ(r.total_area, 25.0 * geo::PI);
}

TEST_F(SimulationTest, UnreachableCleanerGivesZeroConnectionRate) {
    Simulation sim(midtown_market(), central_cleaner(0.001), certain_config());
    ASSERT_TRUE(sim.run_all());
    EXPECT_DOUBLE_EQ(sim.result().summary.connection_rate, 0.0);
    EXPECT_EQ(sim.result().summary.total_offers, 0);
}

TEST_F(SimulationTest, InactiveCleanersNeverConnect) {
    CleanerRegistry idle({Cleaner("idle1", MIDTOWN, 0.9, 10.0, false),
                          Cleaner("idle2", geo::destination(MIDTOWN, geo::PI / 2.0, 1.0), 0.8, 10.0, false)});
    Simulation sim(midtown_market(), std::move(idle), certain_config());
    ASSERT_TRUE(sim.run_all());
    const MetricsSummary& s = sim.result().summary;
    EXPECT_EQ(s.searches, 50);
    EXPECT_DOUBLE_EQ(s.connection_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.coverage_ratio, 0.0);
    EXPECT_EQ(s.number_of_cleaners, 0);
    EXPECT_DOUBLE_EQ(s.avg_service_radius, 0.0);
}

TEST_F(SimulationTest, SummaryCarriesServiceRadius) {
    Simulation sim(midtown_market(), spread_cleaners(), certain_config());
    ASSERT_TRUE(sim.run_all());
    EXPECT_DOUBLE_EQ(sim.result().summary.avg_service_radius, 3.0);
    EXPECT_DOUBLE_EQ(sim.result().runs[0].summary.avg_service_radius, 3.0);
    EXPECT_GE(sim.result().summary.number_of_cleaners, sim.result().summary.number_of_active_cleaners);
}

TEST_F(SimulationTest, SameSeedSameResult) {
    SimulationConfig config;
    config.search_iterations = 200;
    config.supply_configuration_iterations = 3;
    config.random_seed = 1234;

    Simulation a(midtown_market(), spread_cleaners(), config);
    Simulation b(midtown_market(), spread_cleaners(), config);
    ASSERT_TRUE(a.run_all());
    ASSERT_TRUE(b.run_all());
    EXPECT_EQ(serialized(a), serialized(b));

    std::ostringstream csv_a, csv_b;
    SimulationSerializer::write_search_results(a.result(), csv_a);
    SimulationSerializer::write_search_results(b.result(), csv_b);
    EXPECT_EQ(csv_a.str(), csv_b.str());
}

TEST_F(SimulationTest, DifferentSeedsDiffer) {
    SimulationConfig config;
    config.search_iterations = 200;
    Simulation a(midtown_market(), spread_cleaners(), config);
    config.random_seed = 43;
    Simulation b(midtown_market(), spread_cleaners(), config);
    ASSERT_TRUE(a.run_all());
    ASSERT_TRUE(b.run_all());
    EXPECT_NE(a.result().summary.to_json(), b.result().summary.to_json());
}

TEST_F(SimulationTest, RunsAreIndependentStreams) {
    SimulationConfig config;
    config.search_iterations = 100;
    config.supply_configuration_iterations = 2;
    Simulation sim(midtown_market(), spread_cleaners(), config);
    ASSERT_TRUE(sim.run_all());
    const std::vector<RunInfo>& runs = sim.result().runs;
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_NE(runs[0].seed, runs[1].seed);
    EXPECT_NE(runs[0].outcomes[0].point, runs[1].outcomes[0].point);
}

TEST_F(SimulationTest, WorkerCountDoesNotChangeResults) {
    SimulationConfig config;
    config.search_iterations = 150;
    config.supply_configuration_iterations = 5;
    Simulation sequential(midtown_market(), spread_cleaners(), config);
    config.max_workers = 3;
    Simulation parallel(midtown_market(), spread_cleaners(), config);
    ASSERT_TRUE(sequential.run_all());
    ASSERT_TRUE(parallel.run_all());

    EXPECT_EQ(sequential.result().summary.to_json(), parallel.result().summary.to_json());
    ASSERT_EQ(sequential.result().runs.size(), parallel.result().runs.size());
    for (size_t i = 0; i < sequential.result().runs.size(); ++i)
        EXPECT_EQ(sequential.result().runs[i].to_json(), parallel.result().runs[i].to_json());
}

TEST_F(SimulationTest, StopRequestGivesCancelledResult) {
    SimulationConfig config;
    config.supply_configuration_iterations = 2;
    Simulation sim(midtown_market(), spread_cleaners(), config);
    sim.request_stop();
    ASSERT_TRUE(sim.run_all());
    EXPECT_EQ(sim.get_state(), SimulationState::Completed);
    const SimulationResult& r = sim.result();
    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(r.total_searches(), 0);
    for (const RunInfo& run : r.runs) {
        EXPECT_TRUE(run.cancelled);
        EXPECT_EQ(run.searches_completed, 0);
    }
}

TEST_F(SimulationTest, EmptyRegistryFails) {
    Simulation sim(midtown_market(), CleanerRegistry(), SimulationConfig());
    EXPECT_FALSE(sim.run_all());
    EXPECT_EQ(sim.get_state(), SimulationState::Failed);
    EXPECT_EQ(sim.failure_cause().rfind("empty market", 0), 0u);
    EXPECT_THROW(sim.result(), std::logic_error);
    EXPECT_NE(log.text().find("ERROR simulation"), std::string::npos);
}

TEST_F(SimulationTest, InvalidConfigFails) {
    SimulationConfig config;
    config.search_iterations = 0;
    Simulation sim(midtown_market(), central_cleaner(), config);
    EXPECT_FALSE(sim.run_all());
    EXPECT_EQ(sim.get_state(), SimulationState::Failed);
    EXPECT_EQ(sim.failure_cause().rfind("validation error", 0), 0u);
}

TEST_F(SimulationTest, OutOfRangeProbabilityFails) {
    SimulationConfig config;
    config.cleaner_base_bid_probability = 1.5;
    Simulation sim(midtown_market(), central_cleaner(), config);
    EXPECT_FALSE(sim.run_all());
    EXPECT_NE(sim.failure_cause().find("cleaner_base_bid_probability"), std::string::npos);
}

TEST_F(SimulationTest, CleanerOutsideMarketFails) {
    CleanerRegistry registry({make_cleaner("c1", geo::destination(MIDTOWN, 0.0, 20.0))});
    Simulation sim(midtown_market(), std::move(registry), SimulationConfig());
    EXPECT_FALSE(sim.run_all());
    EXPECT_NE(sim.failure_cause().find("outside market"), std::string::npos);
}

TEST_F(SimulationTest, MembershipCheckCanBeDisabled) {
    CleanerRegistry registry({make_cleaner("c1", geo::destination(MIDTOWN, 0.0, 7.0))});
    SimulationConfig config;
    config.require_membership = false;
    Simulation sim(midtown_market(), std::move(registry), config);
    EXPECT_TRUE(sim.run_all());
}

TEST_F(SimulationTest, RunsOnlyOnce) {
    Simulation sim(midtown_market(), central_cleaner(), certain_config());
    ASSERT_TRUE(sim.run_all());
    EXPECT_THROW(sim.run_all(), std::logic_error);
    EXPECT_THROW(sim.set_probability_model(ProbabilityModel()), std::logic_error);
}

TEST_F(SimulationTest, ResultUnavailableBeforeRun) {
    Simulation sim(midtown_market(), central_cleaner(), certain_config());
    EXPECT_THROW(sim.result(), std::logic_error);
}

TEST_F(SimulationTest, StrongerDecayLowersConnectionRate) {
    SimulationConfig config;
    config.search_iterations = 2000;
    config.cleaner_base_bid_probability = 0.5;
    config.connection_base_probability = 0.5;
    config.distance_decay_factor = 0.0;
    Simulation flat(midtown_market(), central_cleaner(10.0, 0.5), config);
    config.distance_decay_factor = 1.0;
    Simulation steep(midtown_market(), central_cleaner(10.0, 0.5), config);
    ASSERT_TRUE(flat.run_all());
    ASSERT_TRUE(steep.run_all());
    EXPECT_NEAR(flat.result().summary.connection_rate, 0.25, 0.04);
    EXPECT_LT(steep.result().summary.connection_rate, flat.result().summary.connection_rate);
}

TEST_F(SimulationTest, SampledCoverage) {
    SimulationConfig config = certain_config();
    Simulation plain(midtown_market(), central_cleaner(), config);
    ASSERT_TRUE(plain.run_all());
    EXPECT_FALSE(plain.result().sampled_coverage.has_value());

    config.coverage_samples = 500;
    Simulation sampled(midtown_market(), central_cleaner(), config);
    ASSERT_TRUE(sampled.run_all());
    ASSERT_TRUE(sampled.result().sampled_coverage.has_value());
    EXPECT_DOUBLE_EQ(*sampled.result().sampled_coverage, 1.0);
    // Coverage probes do not consume the search streams.
    EXPECT_EQ(plain.result().summary.to_json(), sampled.result().summary.to_json());
}

TEST_F(SimulationTest, OutcomesCanBeDropped) {
    SimulationConfig config = certain_config();
    config.keep_outcomes = false;
    Simulation sim(midtown_market(), central_cleaner(), config);
    ASSERT_TRUE(sim.run_all());
    EXPECT_TRUE(sim.result().runs[0].outcomes.empty());
    EXPECT_EQ(sim.result().summary.connections, 50);
}

TEST_F(SimulationTest, InjectedModelAnomaliesAreCounted) {
    Simulation sim(midtown_market(), central_cleaner(), certain_config());
    ProbabilityModel model;
    model.quality_adjustment = [](double) { return -0.5; };
    sim.set_probability_model(model);
    ASSERT_TRUE(sim.run_all());
    EXPECT_EQ(sim.result().summary.anomalies, 50);
    EXPECT_DOUBLE_EQ(sim.result().summary.connection_rate, 0.0);
    EXPECT_NE(log.text().find("clamped"), std::string::npos);
}

TEST_F(SimulationTest, PostalMarketSearchesCarryTheirCell) {
    Market market = Market::postal_code_based("nyc", {
        PostalCell("10001", "nyc", MIDTOWN, 2.0, 3.0),
        PostalCell("10002", "nyc", geo::destination(MIDTOWN, 1.0, 4.0), 1.0),
    });
    Cleaner c = make_cleaner("c1", MIDTOWN);
    c.postal_code = "10001";
    SimulationConfig config;
    config.search_iterations = 100;
    Simulation sim(std::move(market), CleanerRegistry({c}), config);
    ASSERT_TRUE(sim.run_all());
    for (const SearchOutcome& o : sim.result().runs[0].outcomes)
        EXPECT_TRUE(o.postal_code == "10001" || o.postal_code == "10002");
    EXPECT_DOUBLE_EQ(sim.result().total_area, 3.0 + geo::PI);
}

TEST(SimulationStateTest, Names) {
    EXPECT_STREQ(to_string(SimulationState::Configured), "Configured");
    EXPECT_STREQ(to_string(SimulationState::Running), "Running");
    EXPECT_STREQ(to_string(SimulationState::Completed), "Completed");
    EXPECT_STREQ(to_string(SimulationState::Failed), "Failed");
}
