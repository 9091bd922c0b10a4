/*
 * MarketMetrics.h
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

#ifndef MARKETMETRICS_H
#define MARKETMETRICS_H

#include "SearchOutcome.h"
#include <cstddef>
#include <set>
#include <string>
#include <vector>

class CleanerRegistry;
class Market;
class PCG32;

/**
 * @brief Mean and quartiles of one distribution (zeros when empty).
 */
struct DistributionStats {
    size_t count{0};
    double mean{0.0};
    double p25{0.0};
    double p50{0.0};
    double p75{0.0};

    /**
     * Stats of an ascending-sorted sample; quartiles use linear interpolation.
     */
    static DistributionStats of_sorted(const std::vector<double>& sorted);
    std::string to_json() const;
};

/**
 * @brief Finalized market metrics.
 */
struct MetricsSummary {
    long long searches{0};
    long long connections{0};
    long long total_offers{0};
    long long total_bids{0};
    long long anomalies{0};
    long long number_of_cleaners{0};        // distinct cleaners offered at least one search
    long long number_of_active_cleaners{0}; // distinct cleaners that bid at least once

    double connection_rate{0.0};
    double coverage_ratio{0.0};        // searches with >= 1 eligible cleaner / searches
    double search_density{0.0};        // searches per km2
    double connection_density{0.0};    // connections per km2

    double avg_offers_per_search{0.0};
    double avg_bids_per_search{0.0};
    double avg_connections_per_search{0.0};
    double median_bids_per_search{0.0};
    double pct_searches_with_bids{0.0};

    double bids_per_offer{0.0};
    double connections_per_offer{0.0};
    double connections_per_bid{0.0};

    DistributionStats offers_per_search;
    DistributionStats offer_distance, bid_distance, connection_distance;
    DistributionStats offer_score, bid_score, connection_score;

    std::vector<double> connection_distances; // ascending
    std::vector<double> connection_scores;    // ascending

    double avg_service_radius{0.0};           // km, over bidding cleaners; set by the caller

    std::string to_json() const;
};

/**
 * @brief Streaming accumulator of search outcomes.
 *
 * add() and merge() are order independent: counts add up, distributions
 * are sorted when summarized and cleaner ids are kept as sets, so runs can be
 * accumulated separately and merged.
 */
class MarketMetrics {
public:
    void add(const SearchOutcome& outcome);
    void merge(const MarketMetrics& other);

    /**
     * Finalizes the counters against the market area (km2).
     */
    MetricsSummary summarize(double total_area) const;

    long long get_searches() const { return searches; }
    long long get_connections() const { return connections; }
    long long get_searches_with_offers() const { return searches_with_offers; }

private:
    long long searches{0};
    long long searches_with_offers{0};
    long long searches_with_bids{0};
    long long offers{0};
    long long bids{0};
    long long connections{0};
    long long anomalies{0};

    std::vector<double> offers_per_search, bids_per_search;
    std::set<std::string> offered_cleaners, bidding_cleaners;
    std::vector<double> offer_distances, bid_distances, connection_distances;
    std::vector<double> offer_scores, bid_scores, connection_scores;
};

/**
 * Mean service radius (km) of the cleaners that bid; 0 when none does.
 */
double average_service_radius(const CleanerRegistry& registry);

/**
 * Monte Carlo estimate of the share of market area reachable by at least one
 * eligible cleaner: draws `samples` points from the market and tests each.
 * Accuracy improves with more samples. Returns 0 when samples <= 0.
 */
double estimate_coverage(const Market& market, const CleanerRegistry& registry,
                         double search_radius_km, int samples, PCG32& rng);

#endif // MARKETMETRICS_H
