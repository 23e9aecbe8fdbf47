/*
 * Copyright (C) 2026 The ShelfScan authors
 *
 * This file is part of ShelfScan.
 *
 * ShelfScan is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * ShelfScan is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with ShelfScan.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <random>

namespace shelfscan::core::random
{
    using RandGenerator = std::mt19937;
    RandGenerator& getRandGenerator();

    template<typename T>
    T getRandom(T min, T max)
    {
        std::uniform_int_distribution<T> dist{ min, max };
        return dist(getRandGenerator());
    }
} // namespace shelfscan::core::random
