/*
 * Errors.h
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

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @brief Malformed or out-of-range market, cleaner or configuration field.
 *
 * Raised while building inputs, before any search runs.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The market cannot be simulated meaningfully (no cleaners, no area).
 */
class EmptyMarketError : public std::runtime_error {
public:
    explicit EmptyMarketError(const std::string& what) : std::runtime_error(what) {}
};

#endif // ERRORS_H
