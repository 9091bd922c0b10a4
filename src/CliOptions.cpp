/*
 * CliOptions.cpp
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

#include "CliOptions.h"
#include "Errors.h"
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>

static const char* value_of(const char* arg, const char* name) {
    size_t n = std::strlen(name);
    if (std::strncmp(arg, name, n) == 0 && arg[n] == '=')
        return arg + n + 1;
    return nullptr;
}

static double to_double(const char* name, const char* v) {
    std::string s(v);
    try {
        size_t used = 0;
        double d = std::stod(s, &used);
        if (used == s.size())
            return d;
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ValidationError(std::string(name) + " expects a number, got '" + s + "'");
}

static long long to_integer(const char* name, const char* v) {
    std::string s(v);
    try {
        size_t used = 0;
        long long i = std::stoll(s, &used);
        if (used == s.size())
            return i;
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ValidationError(std::string(name) + " expects an integer, got '" + s + "'");
}

static int to_int(const char* name, const char* v) {
    long long i = to_integer(name, v);
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
        throw ValidationError(std::string(name) + " is out of range, got '" + v + "'");
    return (int)i;
}

CliOptions CliOptions::from_args(int argc, const char* const* argv) {
    CliOptions o;
    SimulationConfig& c = o.config;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        const char* v = nullptr;
        if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            o.help = true;
        } else if (std::strcmp(a, "--quiet") == 0) {
            o.quiet = true;
        } else if ((v = value_of(a, "--type"))) {
            o.type = v;
        } else if ((v = value_of(a, "--data-dir"))) {
            o.data_dir = v;
        } else if ((v = value_of(a, "--market-id"))) {
            o.market_id = v;
        } else if ((v = value_of(a, "--center-lat"))) {
            o.center_lat = to_double("--center-lat", v);
            o.has_center_lat = true;
        } else if ((v = value_of(a, "--center-lon"))) {
            o.center_lon = to_double("--center-lon", v);
            o.has_center_lon = true;
        } else if ((v = value_of(a, "--market-radius"))) {
            o.market_radius = to_double("--market-radius", v);
            o.has_market_radius = true;
        } else if ((v = value_of(a, "--output-dir"))) {
            o.output_dir = v;
        } else if ((v = value_of(a, "--search-iterations"))) {
            c.search_iterations = to_int("--search-iterations", v);
        } else if ((v = value_of(a, "--supply-iterations"))) {
            c.supply_configuration_iterations = to_int("--supply-iterations", v);
        } else if ((v = value_of(a, "--random-seed"))) {
            long long seed = to_integer("--random-seed", v);
            if (seed < 0)
                throw ValidationError(std::string("--random-seed must not be negative, got '") + v + "'");
            c.random_seed = (uint64_t)seed;
        } else if ((v = value_of(a, "--search-radius"))) {
            c.search_radius_km = to_double("--search-radius", v);
        } else if ((v = value_of(a, "--bid-probability"))) {
            c.cleaner_base_bid_probability = to_double("--bid-probability", v);
        } else if ((v = value_of(a, "--connection-probability"))) {
            c.connection_base_probability = to_double("--connection-probability", v);
        } else if ((v = value_of(a, "--distance-decay"))) {
            c.distance_decay_factor = to_double("--distance-decay", v);
        } else if ((v = value_of(a, "--workers"))) {
            c.max_workers = to_int("--workers", v);
        } else if ((v = value_of(a, "--coverage-samples"))) {
            c.coverage_samples = to_int("--coverage-samples", v);
        } else {
            throw ValidationError(std::string("unknown option ") + a);
        }
    }
    if (o.help)
        return o;

    if (o.type != "postal_code" && o.type != "location")
        throw ValidationError("--type must be postal_code or location");
    if (o.data_dir.empty())
        throw ValidationError("--data-dir is required");
    if (o.market_id.empty())
        throw ValidationError("--market-id is required");
    if (o.type == "location" && !(o.has_center_lat && o.has_center_lon && o.has_market_radius))
        throw ValidationError("location markets require --center-lat, --center-lon and --market-radius");
    return o;
}

void CliOptions::print_help(const char* prog) {
    std::printf("Usage: %s --type=postal_code|location --data-dir=DIR --market-id=ID [options]\n", prog);
    std::printf("Location markets:\n");
    std::printf("  --center-lat=DEG --center-lon=DEG --market-radius=KM\n");
    std::printf("Options:\n");
    std::printf("  --search-iterations=N       searches per supply configuration (100)\n");
    std::printf("  --supply-iterations=N       supply configuration repeats (1)\n");
    std::printf("  --random-seed=N             master seed (42)\n");
    std::printf("  --search-radius=KM          search radius cap (10)\n");
    std::printf("  --bid-probability=P         base bid probability (0.14)\n");
    std::printf("  --connection-probability=P  base connection probability (0.4)\n");
    std::printf("  --distance-decay=K          distance decay per km (0.2)\n");
    std::printf("  --workers=N                 worker threads across supply configurations (1)\n");
    std::printf("  --coverage-samples=N        sampled coverage probes, 0 to skip (0)\n");
    std::printf("  --output-dir=DIR            where results are written (simulation_results)\n");
    std::printf("  --quiet                     only log warnings and errors\n");
}
