/*
 * CliOptions.h
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

#ifndef CLIOPTIONS_H
#define CLIOPTIONS_H

#include "SimulationConfig.h"
#include <string>

/**
 * @brief Command line of the marketsim executable.
 */
struct CliOptions {
    std::string type;            // "postal_code" or "location"
    std::string data_dir;
    std::string market_id;
    double center_lat{0.0};
    double center_lon{0.0};
    double market_radius{0.0};
    bool has_center_lat{false};
    bool has_center_lon{false};
    bool has_market_radius{false};
    std::string output_dir{"simulation_results"};
    bool quiet{false};
    bool help{false};

    SimulationConfig config;

    /**
     * Parses --name=value arguments. Throws ValidationError on an unknown
     * option, a malformed value or a missing required option.
     */
    static CliOptions from_args(int argc, const char* const* argv);
    static void print_help(const char* prog);
};

#endif // CLIOPTIONS_H
