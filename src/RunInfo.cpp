/*
 * RunInfo.cpp
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

#include "RunInfo.h"
#include <cstdio>
#include <sstream>

void RunInfo::report() const {
    // Reports the outcome of one supply configuration iteration.
    if (cancelled)
        std::printf("***");
    std::printf("%5d %8d %8lld %8.4f %8.4f %8.3f %7.2fs\n",
                run,
                searches_completed,
                summary.connections,
                summary.connection_rate,
                summary.coverage_ratio,
                summary.avg_bids_per_search,
                time_spent);
}

std::string RunInfo::to_json() const {
    // time_spent is left out: serialized runs must be reproducible byte for byte.
    std::ostringstream oss;
    oss << "{";
    oss << "\"run\":" << run << ",";
    oss << "\"seed\":" << seed << ",";
    oss << "\"searches_completed\":" << searches_completed << ",";
    oss << "\"cancelled\":" << (cancelled ? "true" : "false") << ",";
    oss << "\"summary\":" << summary.to_json();
    oss << "}";
    return oss.str();
}
