/*
 * PostalCell.h
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

#ifndef POSTALCELL_H
#define POSTALCELL_H

#include "GeoPoint.h"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class PCG32;

/**
 * @brief One postal-code area of a market.
 *
 * Demand weight is the short-term-rental total addressable market (str_tam).
 * Immutable once loaded.
 */
struct PostalCell {
    std::string postal_code;
    std::string market;
    GeoPoint centroid;
    double str_tam{0.0};
    std::optional<double> area_km2;

    PostalCell() {}
    PostalCell(std::string code, std::string market_id, GeoPoint c, double tam,
               std::optional<double> area = std::nullopt)
        : postal_code(std::move(code)), market(std::move(market_id)), centroid(c),
          str_tam(tam), area_km2(area) {}

    /**
     * Throws ValidationError on empty code, bad centroid, negative str_tam
     * or non-positive area.
     */
    void validate() const;

    /**
     * Radius of the disc searches are drawn from around the centroid:
     * the radius of a circle with the cell's area, or `jitter_km` when the
     * area is unknown.
     */
    double sampling_radius(double jitter_km) const;
};

namespace geo {

/**
 * Draws a cell with probability proportional to str_tam, then a point
 * uniformly inside that cell's sampling disc. Returns the chosen cell index
 * through `chosen`. Total str_tam must be positive.
 */
GeoPoint random_point_in_cells(const std::vector<PostalCell>& cells, double jitter_km,
                               PCG32& rng, size_t* chosen = nullptr);

} // namespace geo

#endif // POSTALCELL_H
