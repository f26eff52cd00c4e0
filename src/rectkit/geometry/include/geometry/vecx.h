/*
 * Copyright (c) 2026 rectkit Team.
 * 
 * This file is part of rectkit project.
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 * 
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <geometry/coordinate.h>

namespace rectkit::geometry {
    /*! \brief A basic 2D vector over a coordinate type
    */
    template <typename T>
    struct basic_vec2 {
        T x;
        T y;

        basic_vec2()
            : x()
            , y() {
        }

        basic_vec2(const T x, const T y)
            : x(x)
            , y(y) {
        }

        bool operator==(const basic_vec2 &rhs) const {
            return (x == rhs.x) && (y == rhs.y);
        }

        bool operator!=(const basic_vec2 &rhs) const {
            return (x != rhs.x) || (y != rhs.y);
        }
    };

    using vec2 = basic_vec2<int>;
}
