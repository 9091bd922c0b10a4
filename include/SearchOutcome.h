/*
 * SearchOutcome.h
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

#ifndef SEARCHOUTCOME_H
#define SEARCHOUTCOME_H

#include "GeoPoint.h"
#include <string>
#include <vector>

/**
 * @brief An eligible cleaner offered the search, and whether it bid.
 */
struct Offer {
    std::string contractor_id;
    double distance{0.0};
    double cleaner_score{0.0};
    double bid_probability{0.0}; // clamped
    bool bid{false};
};

/**
 * @brief A cleaner that bid, and what happened to its bid.
 */
struct Bid {
    std::string contractor_id;
    double distance{0.0};
    double cleaner_score{0.0};
    double bid_probability{0.0};
    double connection_probability{0.0}; // clamped; 0 when no draw was taken
    bool drawn{false};                  // false once an earlier bidder connected
    bool connected{false};
};

/**
 * @brief Everything one simulated search produced.
 *
 * Offers and bids keep distance order. At most one bid is connected.
 */
struct SearchOutcome {
    int search_index{0};
    GeoPoint point;
    std::string postal_code;       // sampled cell, empty for circular markets
    std::vector<Offer> offers;
    std::vector<Bid> bids;
    int connected_bid{-1};         // index into bids, -1 if none
    int anomalies{0};              // probabilities clamped up from < 0 or NaN

    bool has_offers() const { return !offers.empty(); }
    bool has_connection() const { return connected_bid >= 0; }
    const Bid* connection() const {
        return has_connection() ? &bids[(size_t)connected_bid] : nullptr;
    }
};

#endif // SEARCHOUTCOME_H
