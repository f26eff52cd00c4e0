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

#include <type_traits>

namespace rectkit::geometry {
    /**
     * \brief Capability set of a coordinate type.
     * 
     * A coordinate must be totally ordered (<, <=, >, >=, ==, !=) and support +, - and *.
     * The unit step is the only thing that can not be derived from the operators, so it lives here.
     * 
     * Built-in arithmetic types work out of the box. Other types specialize this trait.
     */
    template <typename T, typename = void>
    struct coord_traits {
        static constexpr T one() {
            return T(1);
        }
    };

    template <typename T>
    constexpr T coord_one() {
        return coord_traits<T>::one();
    }

    /*! \brief Two in the coordinate space, without requiring a conversion from int. */
    template <typename T>
    constexpr T coord_two() {
        return coord_traits<T>::one() + coord_traits<T>::one();
    }
}
