/*
 * Market.h
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

#ifndef MARKET_H
#define MARKET_H

#include "GeoPoint.h"
#include "PostalCell.h"
#include <string>
#include <utility>
#include <variant>
#include <vector>

class PCG32;

enum class MarketKind { PostalCodeBased, LocationBased };

/**
 * @brief Market payload made of postal-code cells.
 */
struct PostalArea {
    std::vector<PostalCell> cells;
    double jitter_km{1.0}; // sampling spread for cells with no known area
};

/**
 * @brief Market payload made of a single disc.
 */
struct CircleArea {
    GeoPoint center;
    double radius_km{0.0};
};

/**
 * @brief A search point and the postal code it was drawn from (empty for
 * location-based markets).
 */
struct SearchPoint {
    GeoPoint point;
    std::string postal_code;
};

/**
 * @brief The geography searches are drawn from.
 *
 * Simulation rules:
 * - A market is either a union of postal cells weighted by demand, or a circle.
 * - Built once from validated input and read-only for the whole simulation.
 * - Searches are always sampled from inside the market, so contains() is only
 *   used for coverage bookkeeping.
 */
class Market {
public:
    /**
     * Postal-code based market. Throws ValidationError on an empty cell list,
     * duplicate postal codes, an invalid cell, non-positive total str_tam or
     * a negative jitter.
     */
    static Market postal_code_based(std::string market_id, std::vector<PostalCell> cells,
                                    double jitter_km = 1.0);
    /**
     * Location based market. Throws ValidationError on an invalid center or
     * a radius that is not positive.
     */
    static Market location_based(std::string market_id, GeoPoint center, double radius_km);

    const std::string& id() const { return market_id; }
    MarketKind kind() const;

    /**
     * True if the point belongs to the market (inside the circle, or inside
     * the sampling disc of one of the cells).
     */
    bool contains(const GeoPoint& point) const;
    /**
     * Draws the location of one search.
     * Simulation rule: postal markets pick a cell by str_tam then jitter around
     * it; circular markets sample uniformly by area.
     */
    SearchPoint sample_search_point(PCG32& rng) const;
    /**
     * Total area in square kilometres.
     */
    double total_area() const;
    /**
     * Sum of cell str_tam. Throws std::logic_error for location-based
     * markets, which carry no demand weight.
     */
    double total_demand_weight() const;

    /**
     * Cell with this postal code, or nullptr.
     */
    const PostalCell* find_cell(const std::string& postal_code) const;

    const PostalArea* postal_area() const { return std::get_if<PostalArea>(&area); }
    const CircleArea* circle_area() const { return std::get_if<CircleArea>(&area); }

    std::string to_json() const;

private:
    Market(std::string id, std::variant<PostalArea, CircleArea> a)
        : market_id(std::move(id)), area(std::move(a)) {}

    std::string market_id;
    std::variant<PostalArea, CircleArea> area;
};

#endif // MARKET_H
