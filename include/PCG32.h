/*
 * PCG32.h
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

#ifndef PCG32_H
#define PCG32_H

#include <cstdint>

/**
 * @brief Small seeded generator threaded explicitly through the simulation.
 *
 * Every supply configuration iteration owns one instance, so a run is a
 * deterministic function of its seed.
 */
class PCG32 {
public:
    uint64_t state{0};
    uint64_t inc{0}; // must be odd

    PCG32() {}
    PCG32(uint64_t initstate, uint64_t initseq) { seed(initstate, initseq); }

    void seed(uint64_t initstate, uint64_t initseq);
    uint32_t next();
    /**
     * Uniform double in [0,1) with 53 bits of precision.
     */
    double uniform01();

    /**
     * Derives the seed of run `index` from a master seed (splitmix64 mix).
     * Distinct indices give unrelated streams.
     */
    static uint64_t derive_seed(uint64_t master, uint64_t index);
};

#endif // PCG32_H
