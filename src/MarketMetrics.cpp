/*
 * MarketMetrics.cpp
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

#include "MarketMetrics.h"
#include "CleanerRegistry.h"
#include "JsonText.h"
#include "Market.h"
#include "PCG32.h"
#include <algorithm>
#include <numeric>
#include <sstream>

static double percentile(const std::vector<double>& sorted, double q) {
    if (sorted.empty())
        return 0.0;
    double pos = q * (double)(sorted.size() - 1);
    size_t lo = (size_t)pos;
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - (double)lo;
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

static std::vector<double> sorted_copy(const std::vector<double>& v) {
    std::vector<double> s(v);
    std::sort(s.begin(), s.end());
    return s;
}

static void append(std::vector<double>& to, const std::vector<double>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

static double ratio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

DistributionStats DistributionStats::of_sorted(const std::vector<double>& sorted) {
    DistributionStats s;
    s.count = sorted.size();
    if (sorted.empty())
        return s;
    // Sum in sorted order so the mean does not depend on accumulation order
    s.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / (double)sorted.size();
    s.p25 = percentile(sorted, 0.25);
    s.p50 = percentile(sorted, 0.50);
    s.p75 = percentile(sorted, 0.75);
    return s;
}

std::string DistributionStats::to_json() const {
    std::ostringstream oss;
    oss << "{\"count\":" << count
        << ",\"mean\":" << json_number(mean)
        << ",\"p25\":" << json_number(p25)
        << ",\"p50\":" << json_number(p50)
        << ",\"p75\":" << json_number(p75) << "}";
    return oss.str();
}

void MarketMetrics::add(const SearchOutcome& outcome) {
    ++searches;
    if (outcome.has_offers())
        ++searches_with_offers;
    if (!outcome.bids.empty())
        ++searches_with_bids;
    offers += (long long)outcome.offers.size();
    bids += (long long)outcome.bids.size();
    anomalies += outcome.anomalies;
    offers_per_search.push_back((double)outcome.offers.size());
    bids_per_search.push_back((double)outcome.bids.size());

    for (const Offer& o : outcome.offers) {
        offered_cleaners.insert(o.contractor_id);
        offer_distances.push_back(o.distance);
        offer_scores.push_back(o.cleaner_score);
    }
    for (const Bid& b : outcome.bids) {
        bidding_cleaners.insert(b.contractor_id);
        bid_distances.push_back(b.distance);
        bid_scores.push_back(b.cleaner_score);
    }
    if (const Bid* c = outcome.connection()) {
        ++connections;
        connection_distances.push_back(c->distance);
        connection_scores.push_back(c->cleaner_score);
    }
}

void MarketMetrics::merge(const MarketMetrics& other) {
    searches += other.searches;
    searches_with_offers += other.searches_with_offers;
    searches_with_bids += other.searches_with_bids;
    offers += other.offers;
    bids += other.bids;
    connections += other.connections;
    anomalies += other.anomalies;
    append(offers_per_search, other.offers_per_search);
    append(bids_per_search, other.bids_per_search);
    offered_cleaners.insert(other.offered_cleaners.begin(), other.offered_cleaners.end());
    bidding_cleaners.insert(other.bidding_cleaners.begin(), other.bidding_cleaners.end());
    append(offer_distances, other.offer_distances);
    append(bid_distances, other.bid_distances);
    append(connection_distances, other.connection_distances);
    append(offer_scores, other.offer_scores);
    append(bid_scores, other.bid_scores);
    append(connection_scores, other.connection_scores);
}

MetricsSummary MarketMetrics::summarize(double total_area) const {
    MetricsSummary m;
    m.searches = searches;
    m.connections = connections;
    m.total_offers = offers;
    m.total_bids = bids;
    m.anomalies = anomalies;
    m.number_of_cleaners = (long long)offered_cleaners.size();
    m.number_of_active_cleaners = (long long)bidding_cleaners.size();

    double n = (double)searches;
    m.connection_rate = ratio((double)connections, n);
    m.coverage_ratio = ratio((double)searches_with_offers, n);
    m.search_density = ratio(n, total_area);
    m.connection_density = ratio((double)connections, total_area);

    m.avg_offers_per_search = ratio((double)offers, n);
    m.avg_bids_per_search = ratio((double)bids, n);
    m.avg_connections_per_search = ratio((double)connections, n);
    m.median_bids_per_search = percentile(sorted_copy(bids_per_search), 0.5);
    m.pct_searches_with_bids = ratio((double)searches_with_bids, n);

    m.bids_per_offer = ratio((double)bids, (double)offers);
    m.connections_per_offer = ratio((double)connections, (double)offers);
    m.connections_per_bid = ratio((double)connections, (double)bids);

    m.offers_per_search = DistributionStats::of_sorted(sorted_copy(offers_per_search));
    m.offer_distance = DistributionStats::of_sorted(sorted_copy(offer_distances));
    m.bid_distance = DistributionStats::of_sorted(sorted_copy(bid_distances));
    m.connection_distances = sorted_copy(connection_distances);
    m.connection_distance = DistributionStats::of_sorted(m.connection_distances);

    m.offer_score = DistributionStats::of_sorted(sorted_copy(offer_scores));
    m.bid_score = DistributionStats::of_sorted(sorted_copy(bid_scores));
    m.connection_scores = sorted_copy(connection_scores);
    m.connection_score = DistributionStats::of_sorted(m.connection_scores);
    return m;
}

std::string MetricsSummary::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"searches\":" << searches << ",";
    oss << "\"connections\":" << connections << ",";
    oss << "\"total_offers\":" << total_offers << ",";
    oss << "\"total_bids\":" << total_bids << ",";
    oss << "\"anomalies\":" << anomalies << ",";
    oss << "\"number_of_cleaners\":" << number_of_cleaners << ",";
    oss << "\"number_of_active_cleaners\":" << number_of_active_cleaners << ",";
    oss << "\"connection_rate\":" << json_number(connection_rate) << ",";
    oss << "\"coverage_ratio\":" << json_number(coverage_ratio) << ",";
    oss << "\"search_density\":" << json_number(search_density) << ",";
    oss << "\"connection_density\":" << json_number(connection_density) << ",";
    oss << "\"avg_offers_per_search\":" << json_number(avg_offers_per_search) << ",";
    oss << "\"avg_bids_per_search\":" << json_number(avg_bids_per_search) << ",";
    oss << "\"avg_connections_per_search\":" << json_number(avg_connections_per_search) << ",";
    oss << "\"median_bids_per_search\":" << json_number(median_bids_per_search) << ",";
    oss << "\"pct_searches_with_bids\":" << json_number(pct_searches_with_bids) << ",";
    oss << "\"bids_per_offer\":" << json_number(bids_per_offer) << ",";
    oss << "\"connections_per_offer\":" << json_number(connections_per_offer) << ",";
    oss << "\"connections_per_bid\":" << json_number(connections_per_bid) << ",";
    oss << "\"offers_per_search\":" << offers_per_search.to_json() << ",";
    oss << "\"offer_distance\":" << offer_distance.to_json() << ",";
    oss << "\"bid_distance\":" << bid_distance.to_json() << ",";
    oss << "\"connection_distance\":" << connection_distance.to_json() << ",";
    oss << "\"offer_score\":" << offer_score.to_json() << ",";
    oss << "\"bid_score\":" << bid_score.to_json() << ",";
    oss << "\"connection_score\":" << connection_score.to_json() << ",";
    oss << "\"avg_service_radius\":" << json_number(avg_service_radius);
    oss << "}";
    return oss.str();
}

double average_service_radius(const CleanerRegistry& registry) {
    double sum = 0.0;
    size_t n = 0;
    for (const Cleaner& c : registry) {
        if (!c.bidding_active)
            continue;
        sum += c.service_radius;
        ++n;
    }
    return n > 0 ? sum / (double)n : 0.0;
}

double estimate_coverage(const Market& market, const CleanerRegistry& registry,
                         double search_radius_km, int samples, PCG32& rng) {
    if (samples <= 0)
        return 0.0;
    int covered = 0;
    for (int i = 0; i < samples; ++i) {
        SearchPoint sp = market.sample_search_point(rng);
        if (!registry.eligible_cleaners(sp.point, search_radius_km).empty())
            ++covered;
    }
    return (double)covered / (double)samples;
}
