/*
 * GeoPoint.h
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

#ifndef GEOPOINT_H
#define GEOPOINT_H

#include <string>

class PCG32;

/**
 * @brief A location on the earth's surface, in degrees.
 *
 * Used by value everywhere. Latitude lies in [-90, 90] and longitude in
 * [-180, 180]; validate() enforces that for points read from input.
 */
struct GeoPoint {
    double latitude{0.0};
    double longitude{0.0};

    GeoPoint() {}
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    /**
     * Throws ValidationError if either coordinate is out of range or not finite.
     * `what` names the owner in the error message.
     */
    void validate(const std::string& what) const;

    std::string to_string() const;

    bool operator==(const GeoPoint& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

namespace geo {

constexpr double EARTH_RADIUS_KM = 6371.0;
constexpr double PI = 3.14159265358979323846;

/**
 * Great-circle distance in kilometres (haversine formula).
 */
double distance_km(const GeoPoint& a, const GeoPoint& b);

/**
 * Point reached travelling `distance` km from `origin` along the initial
 * bearing `bearing_rad` (radians clockwise from north).
 */
GeoPoint destination(const GeoPoint& origin, double bearing_rad, double distance);

/**
 * Point drawn uniformly by area inside the disc of `radius` km around `center`.
 * Draws r = radius * sqrt(U) and theta = 2 * pi * U' from `rng`, in that order.
 */
GeoPoint random_point_in_circle(const GeoPoint& center, double radius, PCG32& rng);

double circle_area(double radius);

} // namespace geo

#endif // GEOPOINT_H
