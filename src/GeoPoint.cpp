/*
 * GeoPoint.cpp
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

#include "GeoPoint.h"
#include "Errors.h"
#include "PCG32.h"
#include <algorithm>
#include <cmath>
#include <sstream>

static double to_radians(double deg) { return deg * geo::PI / 180.0; }
static double to_degrees(double rad) { return rad * 180.0 / geo::PI; }

void GeoPoint::validate(const std::string& what) const {
    if (!std::isfinite(latitude) || latitude < -90.0 || latitude > 90.0) {
        std::ostringstream oss;
        oss << what << ": latitude " << latitude << " must be between -90 and 90";
        throw ValidationError(oss.str());
    }
    if (!std::isfinite(longitude) || longitude < -180.0 || longitude > 180.0) {
        std::ostringstream oss;
        oss << what << ": longitude " << longitude << " must be between -180 and 180";
        throw ValidationError(oss.str());
    }
}

std::string GeoPoint::to_string() const {
    std::ostringstream oss;
    oss.precision(6);
    oss << std::fixed << "(" << latitude << "," << longitude << ")";
    return oss.str();
}

namespace geo {

double distance_km(const GeoPoint& a, const GeoPoint& b) {
    double lat1 = to_radians(a.latitude);
    double lat2 = to_radians(b.latitude);
    double dlat = lat2 - lat1;
    double dlon = to_radians(b.longitude - a.longitude);

    double s1 = std::sin(dlat / 2.0);
    double s2 = std::sin(dlon / 2.0);
    double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
    h = std::min(1.0, std::max(0.0, h)); // rounding can leave h marginally outside [0,1]
    return 2.0 * EARTH_RADIUS_KM * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

GeoPoint destination(const GeoPoint& origin, double bearing_rad, double distance) {
    double delta = distance / EARTH_RADIUS_KM;
    double lat1 = to_radians(origin.latitude);
    double lon1 = to_radians(origin.longitude);

    double sin_lat2 = std::sin(lat1) * std::cos(delta) +
                      std::cos(lat1) * std::sin(delta) * std::cos(bearing_rad);
    sin_lat2 = std::min(1.0, std::max(-1.0, sin_lat2));
    double lat2 = std::asin(sin_lat2);
    double lon2 = lon1 + std::atan2(std::sin(bearing_rad) * std::sin(delta) * std::cos(lat1),
                                    std::cos(delta) - std::sin(lat1) * sin_lat2);

    double lon_deg = std::fmod(to_degrees(lon2) + 540.0, 360.0) - 180.0;
    return GeoPoint(to_degrees(lat2), lon_deg);
}

GeoPoint random_point_in_circle(const GeoPoint& center, double radius, PCG32& rng) {
    // Simulation rule: searches are uniform by area, so r ~ radius * sqrt(U)
    // (uniform r would crowd points near the center).
    double r = radius * std::sqrt(rng.uniform01());
    double theta = 2.0 * PI * rng.uniform01();
    if (r <= 0.0)
        return center;
    return destination(center, theta, r);
}

double circle_area(double radius) {
    return PI * radius * radius;
}

} // namespace geo
