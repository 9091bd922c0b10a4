/*
 * PostalCell.cpp
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

#include "PostalCell.h"
#include "Errors.h"
#include "PCG32.h"
#include <cmath>

void PostalCell::validate() const {
    if (postal_code.empty())
        throw ValidationError("postal cell: postal_code must not be empty");
    centroid.validate("postal cell " + postal_code);
    if (!std::isfinite(str_tam) || str_tam < 0.0)
        throw ValidationError("postal cell " + postal_code + ": str_tam cannot be negative");
    if (area_km2 && (!std::isfinite(*area_km2) || *area_km2 <= 0.0))
        throw ValidationError("postal cell " + postal_code + ": area must be positive");
}

double PostalCell::sampling_radius(double jitter_km) const {
    if (area_km2)
        return std::sqrt(*area_km2 / geo::PI);
    return jitter_km;
}

namespace geo {

GeoPoint random_point_in_cells(const std::vector<PostalCell>& cells, double jitter_km,
                               PCG32& rng, size_t* chosen) {
    double total = 0.0;
    for (const PostalCell& cell : cells)
        total += cell.str_tam;
    if (cells.empty() || total <= 0.0)
        throw ValidationError("cannot sample a point: total str_tam must be positive");

    // Simulation rule: searches originate where demand is, so the cell is
    // picked proportionally to its str_tam.
    double u = rng.uniform01() * total;
    size_t pick = cells.size();
    double acc = 0.0;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i].str_tam <= 0.0)
            continue;
        pick = i;
        acc += cells[i].str_tam;
        if (u < acc)
            break;
    }
    if (chosen)
        *chosen = pick;

    const PostalCell& cell = cells[pick];
    double radius = cell.sampling_radius(jitter_km);
    if (radius <= 0.0)
        return cell.centroid;
    return random_point_in_circle(cell.centroid, radius, rng);
}

} // namespace geo
