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

#include <common/algorithm.h>
#include <geometry/coordinate.h>

#include <optional>
#include <type_traits>

namespace rectkit::geometry {
    /**
     * \brief Access a rectangle type through its sides.
     * 
     * By default this forwards to the members of the type: coord_type, left(), right(), top(),
     * bottom() and the static from_sides(). Types that can not have these members (structures from
     * another library for example) specialize this trait instead.
     * 
     * Sides are inclusive, and top is the greater coordinate on the vertical axis. Nothing checks that
     * left <= right and bottom <= top, inverted sides give a degenerate rectangle.
     */
    template <typename R>
    struct rect_traits {
        using coord_type = typename R::coord_type;

        static coord_type left(const R &r) {
            return r.left();
        }

        static coord_type right(const R &r) {
            return r.right();
        }

        static coord_type top(const R &r) {
            return r.top();
        }

        static coord_type bottom(const R &r) {
            return r.bottom();
        }

        static R from_sides(const coord_type left, const coord_type right, const coord_type top, const coord_type bottom) {
            return R::from_sides(left, right, top, bottom);
        }
    };

    template <typename R>
    using coord_of = typename rect_traits<R>::coord_type;

    template <typename A, typename B>
    constexpr bool same_coord_v = std::is_same_v<coord_of<A>, coord_of<B>>;

    template <typename R>
    coord_of<R> width(const R &r) {
        return rect_traits<R>::right(r) - rect_traits<R>::left(r);
    }

    template <typename R>
    coord_of<R> height(const R &r) {
        return rect_traits<R>::top(r) - rect_traits<R>::bottom(r);
    }

    template <typename R>
    coord_of<R> perimeter(const R &r) {
        return (width(r) + height(r)) * coord_two<coord_of<R>>();
    }

    template <typename R>
    coord_of<R> area(const R &r) {
        return width(r) * height(r);
    }

    /*! \brief Get a copy of the rectangle shifted by the given deltas. */
    template <typename R>
    R translate(const R &r, const coord_of<R> dx, const coord_of<R> dy) {
        using traits = rect_traits<R>;
        return traits::from_sides(traits::left(r) + dx, traits::right(r) + dx, traits::top(r) + dy,
            traits::bottom(r) + dy);
    }

    template <typename R>
    bool contains_point(const R &r, const coord_of<R> x, const coord_of<R> y) {
        using traits = rect_traits<R>;
        return (traits::left(r) <= x) && (x <= traits::right(r)) && (traits::bottom(r) <= y) && (y <= traits::top(r));
    }

    /**
     * \brief Check if a rectangle lies completely inside another.
     * 
     * \param outer The rectangle that may contain.
     * \param inner The rectangle that may be contained.
     * 
     * \returns True if every side of outer is at least as extreme as the matching side of inner.
     */
    template <typename A, typename B>
    bool contains(const A &outer, const B &inner) {
        static_assert(same_coord_v<A, B>, "Rectangles must share the coordinate type");

        using ta = rect_traits<A>;
        using tb = rect_traits<B>;

        return (ta::left(outer) <= tb::left(inner)) && (ta::right(outer) >= tb::right(inner))
            && (ta::top(outer) >= tb::top(inner)) && (ta::bottom(outer) <= tb::bottom(inner));
    }

    /*! \brief Check if the closed areas of two rectangles have any point in common. */
    template <typename A, typename B>
    bool overlaps(const A &a, const B &b) {
        static_assert(same_coord_v<A, B>, "Rectangles must share the coordinate type");

        using ta = rect_traits<A>;
        using tb = rect_traits<B>;

        return (ta::left(a) <= tb::right(b)) && (ta::right(a) >= tb::left(b)) && (ta::top(a) >= tb::bottom(b))
            && (ta::bottom(a) <= tb::top(b));
    }

    /**
     * \brief Get the intersection of two rectangles.
     * 
     * The result has the type of the first rectangle.
     * 
     * \returns The shared rectangle, or std::nullopt if the two do not overlap.
     */
    template <typename A, typename B>
    std::optional<A> intersection(const A &a, const B &b) {
        static_assert(same_coord_v<A, B>, "Rectangles must share the coordinate type");

        using ta = rect_traits<A>;
        using tb = rect_traits<B>;

        const coord_of<A> left = common::max(ta::left(a), tb::left(b));
        const coord_of<A> right = common::min(ta::right(a), tb::right(b));
        const coord_of<A> top = common::min(ta::top(a), tb::top(b));
        const coord_of<A> bottom = common::max(ta::bottom(a), tb::bottom(b));

        if ((left <= right) && (bottom <= top)) {
            return ta::from_sides(left, right, top, bottom);
        }

        return std::nullopt;
    }

    /*! \brief Get the smallest rectangle that holds both rectangles. Has the type of the first one. */
    template <typename A, typename B>
    A bounding_union(const A &a, const B &b) {
        static_assert(same_coord_v<A, B>, "Rectangles must share the coordinate type");

        using ta = rect_traits<A>;
        using tb = rect_traits<B>;

        return ta::from_sides(common::min(ta::left(a), tb::left(b)), common::max(ta::right(a), tb::right(b)),
            common::max(ta::top(a), tb::top(b)), common::min(ta::bottom(a), tb::bottom(b)));
    }

    template <typename A, typename B>
    bool same_sides(const A &a, const B &b) {
        static_assert(same_coord_v<A, B>, "Rectangles must share the coordinate type");

        using ta = rect_traits<A>;
        using tb = rect_traits<B>;

        return (ta::left(a) == tb::left(b)) && (ta::right(a) == tb::right(b)) && (ta::top(a) == tb::top(b))
            && (ta::bottom(a) == tb::bottom(b));
    }
}
