/*
 * DataLoader.cpp
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

#include "DataLoader.h"
#include "Errors.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

/**
 * One table being read: header lookup plus typed field access with
 * source/line context in every error.
 */
class CsvTable {
public:
    CsvTable(std::istream& in, std::string source) : in(in), source(std::move(source)) {
        std::string header;
        if (!std::getline(in, header))
            throw ValidationError(this->source + ": missing header row");
        line_no = 1;
        std::vector<std::string> names = DataLoader::split_line(header);
        for (size_t i = 0; i < names.size(); ++i)
            columns[lower(trim(names[i]))] = i;
    }

    bool has(const std::string& column) const { return columns.count(column) > 0; }

    void require(const std::vector<std::string>& names) const {
        for (const std::string& n : names) {
            if (!has(n))
                throw ValidationError(source + ": missing column " + n);
        }
    }

    bool next() {
        std::string line;
        while (std::getline(in, line)) {
            ++line_no;
            if (trim(line).empty())
                continue;
            fields = DataLoader::split_line(line);
            return true;
        }
        return false;
    }

    std::string text(const std::string& column) const {
        auto it = columns.find(column);
        if (it == columns.end() || it->second >= fields.size())
            return std::string();
        return trim(fields[it->second]);
    }

    double number(const std::string& column) const {
        std::string t = text(column);
        try {
            size_t used = 0;
            double v = std::stod(t, &used);
            if (used == t.size())
                return v;
        } catch (const std::logic_error&) {
            // reported below
        }
        fail(column, t, "a number");
        return 0.0;
    }

    int integer(const std::string& column) const {
        std::string t = text(column);
        long long v = 0;
        try {
            size_t used = 0;
            v = std::stoll(t, &used);
            if (used != t.size())
                fail(column, t, "an integer");
        } catch (const std::logic_error&) {
            fail(column, t, "an integer");
        }
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            fail(column, t, "within the 32-bit integer range");
        return (int)v;
    }

    bool boolean(const std::string& column) const {
        std::string t = text(column);
        bool v = false;
        if (!DataLoader::parse_bool(t, v))
            fail(column, t, "a boolean");
        return v;
    }

    std::string where() const {
        return source + ":" + std::to_string(line_no);
    }

private:
    std::istream& in;
    std::string source;
    std::map<std::string, size_t> columns;
    std::vector<std::string> fields;
    int line_no{0};

    [[noreturn]] void fail(const std::string& column, const std::string& t, const char* expected) const {
        throw ValidationError(where() + ": column " + column + " value '" + t + "' is not " + expected);
    }
};

} // namespace

DataLoader::DataLoader(std::string data_directory) : data_directory(std::move(data_directory)) {}

std::string DataLoader::path_of(const std::string& filename) const {
    if (data_directory.empty())
        return filename;
    if (data_directory.back() == '/')
        return data_directory + filename;
    return data_directory + "/" + filename;
}

std::vector<std::string> DataLoader::split_line(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur += ch;
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            out.push_back(cur);
            cur.clear();
        } else if (ch != '\r') {
            cur += ch;
        }
    }
    out.push_back(cur);
    return out;
}

bool DataLoader::parse_bool(const std::string& text, bool& value) {
    std::string t = lower(trim(text));
    if (t == "true" || t == "1" || t == "yes" || t == "t" || t == "y") {
        value = true;
        return true;
    }
    if (t == "false" || t == "0" || t == "no" || t == "f" || t == "n") {
        value = false;
        return true;
    }
    return false;
}

std::vector<PostalCell> DataLoader::load_postal_codes(std::istream& in, const std::string& source) const {
    CsvTable table(in, source);
    table.require({"postal_code", "market", "latitude", "longitude", "str_tam"});
    bool has_area = table.has("area");

    std::vector<PostalCell> cells;
    while (table.next()) {
        PostalCell cell;
        cell.postal_code = table.text("postal_code");
        cell.market = table.text("market");
        cell.centroid = GeoPoint(table.number("latitude"), table.number("longitude"));
        cell.str_tam = table.number("str_tam");
        if (has_area && !table.text("area").empty())
            cell.area_km2 = table.number("area");
        try {
            cell.validate();
        } catch (const ValidationError& e) {
            throw ValidationError(table.where() + ": " + e.what());
        }
        cells.push_back(std::move(cell));
    }
    return cells;
}

std::vector<PostalCell> DataLoader::load_postal_codes(const std::string& filename) const {
    std::string path = path_of(filename);
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open " + path);
    return load_postal_codes(in, path);
}

std::vector<Cleaner> DataLoader::load_cleaners(std::istream& in, const std::string& source) const {
    CsvTable table(in, source);
    table.require({"contractor_id", "latitude", "longitude"});

    std::vector<Cleaner> cleaners;
    while (table.next()) {
        // Missing optional columns keep the Cleaner defaults
        Cleaner c;
        c.contractor_id = table.text("contractor_id");
        c.location = GeoPoint(table.number("latitude"), table.number("longitude"));
        if (table.has("postal_code"))
            c.postal_code = table.text("postal_code");
        if (table.has("bidding_active"))
            c.bidding_active = table.boolean("bidding_active");
        if (table.has("assignment_active"))
            c.assignment_active = table.boolean("assignment_active");
        if (table.has("cleaner_score"))
            c.cleaner_score = table.number("cleaner_score");
        if (table.has("service_radius"))
            c.service_radius = table.number("service_radius");
        if (table.has("team_size"))
            c.team_size = table.integer("team_size");
        if (table.has("active_connections"))
            c.active_connections = table.integer("active_connections");
        try {
            c.validate();
        } catch (const ValidationError& e) {
            throw ValidationError(table.where() + ": " + e.what());
        }
        cleaners.push_back(std::move(c));
    }
    return cleaners;
}

std::vector<Cleaner> DataLoader::load_cleaners(const std::string& filename) const {
    std::string path = path_of(filename);
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("cannot open " + path);
    return load_cleaners(in, path);
}

Market DataLoader::load_postal_market(const std::string& market_id, double jitter_km,
                                      const std::string& filename) const {
    std::vector<PostalCell> all = load_postal_codes(filename);
    std::vector<PostalCell> mine;
    for (PostalCell& cell : all) {
        if (cell.market == market_id)
            mine.push_back(std::move(cell));
    }
    if (mine.empty())
        throw ValidationError("no postal codes for market " + market_id + " in " + path_of(filename));
    return Market::postal_code_based(market_id, std::move(mine), jitter_km);
}
