/*
 * DataLoader.h
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

#ifndef DATALOADER_H
#define DATALOADER_H

#include "Cleaner.h"
#include "Market.h"
#include "PostalCell.h"
#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Reads the two input tables (postal-code geography and cleaners) from CSV.
 *
 * Columns are located by header name, so their order does not matter.
 * Every row is validated as it is read; a bad row raises ValidationError
 * naming the source and line.
 *
 * postal_codes.csv: postal_code,market,latitude,longitude,str_tam[,area]
 * cleaners.csv:     contractor_id,latitude,longitude[,postal_code][,bidding_active]
 *                   [,assignment_active][,cleaner_score][,service_radius]
 *                   [,team_size][,active_connections]
 */
class DataLoader {
public:
    explicit DataLoader(std::string data_directory = std::string());

    std::vector<PostalCell> load_postal_codes(std::istream& in, const std::string& source) const;
    std::vector<PostalCell> load_postal_codes(const std::string& filename = "postal_codes.csv") const;

    std::vector<Cleaner> load_cleaners(std::istream& in, const std::string& source) const;
    std::vector<Cleaner> load_cleaners(const std::string& filename = "cleaners.csv") const;

    /**
     * Postal-code market made of the rows whose market column equals market_id.
     * Throws ValidationError when no row matches.
     */
    Market load_postal_market(const std::string& market_id, double jitter_km,
                              const std::string& filename = "postal_codes.csv") const;

    /**
     * Splits one CSV line, honouring double-quoted fields.
     */
    static std::vector<std::string> split_line(const std::string& line);
    /**
     * Parses true/false/1/0/yes/no (any case).
     */
    static bool parse_bool(const std::string& text, bool& value);

private:
    std::string data_directory;

    std::string path_of(const std::string& filename) const;
};

#endif // DATALOADER_H
