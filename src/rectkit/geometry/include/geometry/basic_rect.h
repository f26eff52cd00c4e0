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

#include <geometry/rectangle.h>
#include <geometry/vecx.h>

namespace rectkit::geometry {
    /**
     * \brief A simple structure represents a rectangle.
     * 
     * This struct describes the rectangle by the position of its top left corner and its size.
     * The vertical axis points up, so the bottom side is the origin's y minus the height.
     */
    template <typename T>
    struct basic_rect {
        using coord_type = T;

        basic_vec2<T> origin; ///< Top left of the rectangle.
        basic_vec2<T> size; ///< Width and height of the rectangle.

        basic_rect() = default;

        explicit basic_rect(const basic_vec2<T> &origin_, const basic_vec2<T> &size_)
            : origin(origin_)
            , size(size_) {
        }

        static basic_rect from_sides(const T left, const T right, const T top, const T bottom) {
            return basic_rect({ left, top }, { right - left, top - bottom });
        }

        T left() const {
            return origin.x;
        }

        T right() const {
            return origin.x + size.x;
        }

        T top() const {
            return origin.y;
        }

        T bottom() const {
            return origin.y - size.y;
        }

        /**
         * \brief Check if the rectangle region is empty.
         * 
         * This is equals to checking if the size is 0
         */
        bool empty() const {
            return (size.x == T()) && (size.y == T());
        }

        bool valid() const {
            return (size.x >= T()) && (size.y >= T());
        }

        bool operator==(const basic_rect &rhs) const {
            return (origin == rhs.origin) && (size == rhs.size);
        }

        bool operator!=(const basic_rect &rhs) const {
            return !(*this == rhs);
        }
    };

    using rect = basic_rect<int>;
}
