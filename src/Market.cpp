/*
 * Market.cpp
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

#include "Market.h"
#include "Errors.h"
#include "JsonText.h"
#include "PCG32.h"
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

// Containment tolerance: sampled points are projected back onto the sphere
// and may land a rounding error beyond the radius.
static constexpr double CONTAINS_EPS_KM = 1e-9;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Market Market::postal_code_based(std::string market_id, std::vector<PostalCell> cells,
                                 double jitter_km) {
    if (market_id.empty())
        throw ValidationError("market: id must not be empty");
    if (cells.empty())
        throw ValidationError("market " + market_id + ": needs at least one postal code");
    if (!std::isfinite(jitter_km) || jitter_km < 0.0)
        throw ValidationError("market " + market_id + ": jitter radius cannot be negative");

    std::set<std::string> seen;
    double total_tam = 0.0;
    for (const PostalCell& cell : cells) {
        cell.validate();
        if (!seen.insert(cell.postal_code).second)
            throw ValidationError("market " + market_id + ": duplicate postal code " + cell.postal_code);
        total_tam += cell.str_tam;
    }
    if (total_tam <= 0.0)
        throw ValidationError("market " + market_id + ": total str_tam must be positive");

    PostalArea area;
    area.cells = std::move(cells);
    area.jitter_km = jitter_km;
    return Market(std::move(market_id), std::move(area));
}

Market Market::location_based(std::string market_id, GeoPoint center, double radius_km) {
    if (market_id.empty())
        throw ValidationError("market: id must not be empty");
    center.validate("market " + market_id + " center");
    if (!std::isfinite(radius_km) || radius_km <= 0.0)
        throw ValidationError("market " + market_id + ": radius_km must be positive");

    CircleArea area;
    area.center = center;
    area.radius_km = radius_km;
    return Market(std::move(market_id), area);
}

MarketKind Market::kind() const {
    return std::visit(overloaded{
        [](const PostalArea&) { return MarketKind::PostalCodeBased; },
        [](const CircleArea&) { return MarketKind::LocationBased; },
    }, area);
}

bool Market::contains(const GeoPoint& point) const {
    return std::visit(overloaded{
        [&](const PostalArea& a) {
            for (const PostalCell& cell : a.cells) {
                double d = geo::distance_km(cell.centroid, point);
                if (d <= cell.sampling_radius(a.jitter_km) + CONTAINS_EPS_KM)
                    return true;
            }
            return false;
        },
        [&](const CircleArea& a) {
            return geo::distance_km(a.center, point) <= a.radius_km + CONTAINS_EPS_KM;
        },
    }, area);
}

SearchPoint Market::sample_search_point(PCG32& rng) const {
    return std::visit(overloaded{
        [&](const PostalArea& a) {
            size_t chosen = 0;
            GeoPoint p = geo::random_point_in_cells(a.cells, a.jitter_km, rng, &chosen);
            return SearchPoint{p, a.cells[chosen].postal_code};
        },
        [&](const CircleArea& a) {
            return SearchPoint{geo::random_point_in_circle(a.center, a.radius_km, rng), std::string()};
        },
    }, area);
}

double Market::total_area() const {
    return std::visit(overloaded{
        [](const PostalArea& a) {
            double total = 0.0;
            for (const PostalCell& cell : a.cells) {
                if (cell.area_km2)
                    total += *cell.area_km2;
                else
                    total += geo::circle_area(a.jitter_km);
            }
            return total;
        },
        [](const CircleArea& a) { return geo::circle_area(a.radius_km); },
    }, area);
}

double Market::total_demand_weight() const {
    return std::visit(overloaded{
        [](const PostalArea& a) {
            double total = 0.0;
            for (const PostalCell& cell : a.cells)
                total += cell.str_tam;
            return total;
        },
        [this](const CircleArea&) -> double {
            throw std::logic_error("market " + market_id + ": demand weight only exists for postal code markets");
        },
    }, area);
}

const PostalCell* Market::find_cell(const std::string& postal_code) const {
    const PostalArea* a = postal_area();
    if (!a)
        return nullptr;
    for (const PostalCell& cell : a->cells) {
        if (cell.postal_code == postal_code)
            return &cell;
    }
    return nullptr;
}

std::string Market::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"market_id\":" << json_quote(market_id) << ",";
    std::visit(overloaded{
        [&](const PostalArea& a) {
            oss << "\"type\":\"postal_code\",";
            oss << "\"postal_codes\":" << a.cells.size() << ",";
            oss << "\"cell_jitter_km\":" << json_number(a.jitter_km) << ",";
        },
        [&](const CircleArea& a) {
            oss << "\"type\":\"location\",";
            oss << "\"center_lat\":" << json_number(a.center.latitude) << ",";
            oss << "\"center_lon\":" << json_number(a.center.longitude) << ",";
            oss << "\"radius_km\":" << json_number(a.radius_km) << ",";
        },
    }, area);
    oss << "\"total_area_km2\":" << json_number(total_area());
    oss << "}";
    return oss.str();
}
