/*
 * MatchingEngine.cpp
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

#include "MatchingEngine.h"
#include "Errors.h"
#include "Logger.h"
#include "PCG32.h"
#include <cmath>
#include <sstream>
#include <utility>

MatchingEngine::MatchingEngine(const Market& market, const CleanerRegistry& registry,
                               ProbabilityModel model, double search_radius_km)
    : market(market), registry(registry), model(std::move(model)),
      search_radius_km(search_radius_km) {
    if (!std::isfinite(search_radius_km) || search_radius_km <= 0.0)
        throw ValidationError("search radius must be positive");
    if (!this->model.quality_adjustment || !this->model.capacity_adjustment)
        throw ValidationError("probability model is missing an adjustment function");
}

SearchOutcome MatchingEngine::simulate_search(int search_index, PCG32& rng) const {
    SearchPoint sp = market.sample_search_point(rng);
    return simulate_search_at(search_index, sp.point, sp.postal_code, rng);
}

SearchOutcome MatchingEngine::simulate_search_at(int search_index, const GeoPoint& point,
                                                 const std::string& postal_code, PCG32& rng) const {
    SearchOutcome outcome;
    outcome.search_index = search_index;
    outcome.point = point;
    outcome.postal_code = postal_code;

    std::vector<EligibleCleaner> candidates = registry.eligible_cleaners(point, search_radius_km);
    if (candidates.empty())
        return outcome;

    // Bids: one draw per candidate, nearest first
    outcome.offers.reserve(candidates.size());
    std::vector<const Cleaner*> bidders;
    for (const EligibleCleaner& cand : candidates) {
        const Cleaner& c = *cand.cleaner;
        double u = rng.uniform01();
        double p = clamp_probability(model.raw_bid_probability(c, cand.distance), "bid",
                                     c.contractor_id, outcome);
        Offer offer;
        offer.contractor_id = c.contractor_id;
        offer.distance = cand.distance;
        offer.cleaner_score = c.cleaner_score;
        offer.bid_probability = p;
        offer.bid = u < p;
        outcome.offers.push_back(offer);
        if (offer.bid) {
            Bid bid;
            bid.contractor_id = c.contractor_id;
            bid.distance = cand.distance;
            bid.cleaner_score = c.cleaner_score;
            bid.bid_probability = p;
            outcome.bids.push_back(bid);
            bidders.push_back(&c);
        }
    }

    // Connection: first bidder whose draw succeeds
    for (size_t i = 0; i < outcome.bids.size(); ++i) {
        Bid& bid = outcome.bids[i];
        double u = rng.uniform01();
        double p = clamp_probability(model.raw_connection_probability(*bidders[i], bid.distance),
                                     "connection", bid.contractor_id, outcome);
        bid.drawn = true;
        bid.connection_probability = p;
        if (u < p) {
            bid.connected = true;
            outcome.connected_bid = (int)i;
            break;
        }
    }
    return outcome;
}

double MatchingEngine::clamp_probability(double raw, const char* what, const std::string& contractor_id,
                                         SearchOutcome& outcome) const {
    if (std::isnan(raw) || raw < 0.0) {
        ++outcome.anomalies;
        std::ostringstream oss;
        oss << "search " << outcome.search_index << ": " << what << " probability " << raw
            << " for cleaner " << contractor_id << " clamped to 0";
        Logger::warn("engine", oss.str());
        return 0.0;
    }
    return raw > 1.0 ? 1.0 : raw;
}
