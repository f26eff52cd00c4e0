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

#include <catch2/catch.hpp>
#include <geometry/basic_rect.h>
#include <geometry/rectangle.h>

#include "shapes.h"

#include <vector>

using namespace rectkit;
using geometry::rect;

TEST_CASE("basic_rect_sides", "rectangle") {
    const rect r = rect::from_sides(0, 1, 2, 3);

    REQUIRE(r.left() == 0);
    REQUIRE(r.right() == 1);
    REQUIRE(r.top() == 2);
    REQUIRE(r.bottom() == 3);

    // Inverted vertical sides are kept as is
    REQUIRE(geometry::height(r) == -1);
    REQUIRE_FALSE(r.valid());
}

TEST_CASE("basic_rect_origin_and_size", "rectangle") {
    const rect r(geometry::vec2(2, 10), geometry::vec2(4, 3));

    REQUIRE(r.left() == 2);
    REQUIRE(r.right() == 6);
    REQUIRE(r.top() == 10);
    REQUIRE(r.bottom() == 7);
    REQUIRE(r.valid());
    REQUIRE_FALSE(r.empty());
    REQUIRE(rect::from_sides(2, 2, 10, 10).empty());
    REQUIRE(r == rect::from_sides(2, 6, 10, 7));
    REQUIRE(r != rect::from_sides(2, 6, 10, 6));
}

TEST_CASE("derived_measures", "rectangle") {
    const rect r = rect::from_sides(1, 4, 7, 5);

    REQUIRE(geometry::width(r) == 3);
    REQUIRE(geometry::height(r) == 2);
    REQUIRE(geometry::perimeter(r) == 10);
    REQUIRE(geometry::area(r) == 6);
}

TEST_CASE("translate_is_group_action", "rectangle") {
    const rect r = rect::from_sides(-3, 4, 9, 2);

    REQUIRE(geometry::translate(r, 0, 0) == r);
    REQUIRE(geometry::translate(geometry::translate(r, 2, -5), 7, 1) == geometry::translate(r, 9, -4));

    const rect moved = geometry::translate(r, 10, 20);
    REQUIRE(moved == rect::from_sides(7, 14, 29, 22));
}

TEST_CASE("contains_point_edges_inclusive", "rectangle") {
    const rect r = rect::from_sides(0, 4, 4, 0);

    REQUIRE(geometry::contains_point(r, 0, 0));
    REQUIRE(geometry::contains_point(r, 4, 4));
    REQUIRE(geometry::contains_point(r, 2, 3));
    REQUIRE_FALSE(geometry::contains_point(r, 5, 2));
    REQUIRE_FALSE(geometry::contains_point(r, 2, -1));
}

TEST_CASE("contains_rectangle", "rectangle") {
    const rect outer = rect::from_sides(0, 10, 10, 0);

    REQUIRE(geometry::contains(outer, outer));
    REQUIRE(geometry::contains(outer, rect::from_sides(2, 3, 9, 1)));
    REQUIRE_FALSE(geometry::contains(outer, rect::from_sides(2, 11, 9, 1)));
    REQUIRE_FALSE(geometry::contains(rect::from_sides(2, 3, 9, 1), outer));
}

TEST_CASE("intersection_exists_when_overlapping", "rectangle") {
    std::vector<rect> samples = {
        rect::from_sides(0, 4, 4, 0),
        rect::from_sides(4, 8, 2, -2),
        rect::from_sides(5, 6, 10, 5),
        rect::from_sides(-3, -1, 1, -1),
        rect::from_sides(1, 2, 3, 2),
        rect::from_sides(-10, 10, 0, 0),
        rect::from_sides(2, 2, 20, -20)
    };

    for (const rect &a : samples) {
        for (const rect &b : samples) {
            const std::optional<rect> shared = geometry::intersection(a, b);

            REQUIRE(shared.has_value() == geometry::overlaps(a, b));

            if (shared) {
                REQUIRE(geometry::contains(a, *shared));
                REQUIRE(geometry::contains(b, *shared));
            }
        }
    }
}

TEST_CASE("intersection_values", "rectangle") {
    const rect a = rect::from_sides(0, 4, 4, 0);

    REQUIRE(geometry::intersection(a, rect::from_sides(2, 8, 9, 3)) == rect::from_sides(2, 4, 4, 3));

    // Touching edges share a line, they are closed intervals
    REQUIRE(geometry::intersection(a, rect::from_sides(4, 8, 4, 0)) == rect::from_sides(4, 4, 4, 0));
    REQUIRE_FALSE(geometry::intersection(a, rect::from_sides(5, 8, 4, 0)));
}

TEST_CASE("bounding_union_covers_both", "rectangle") {
    const rect a = rect::from_sides(0, 2, 2, 0);
    const rect b = rect::from_sides(5, 7, 9, 6);

    const rect bound = geometry::bounding_union(a, b);
    REQUIRE(bound == rect::from_sides(0, 7, 9, 0));
    REQUIRE(geometry::contains(bound, a));
    REQUIRE(geometry::contains(bound, b));
}

TEST_CASE("foreign_rectangle_type", "rectangle") {
    const test::screen_box box{ 1, 2, 5, 8 };
    const rect r = rect::from_sides(1, 5, 8, 2);

    REQUIRE(geometry::same_sides(box, r));
    REQUIRE(geometry::width(box) == 4);
    REQUIRE(geometry::height(box) == 6);
    REQUIRE(geometry::contains(r, box));
    REQUIRE(geometry::overlaps(box, rect::from_sides(5, 6, 2, 0)));

    const std::optional<test::screen_box> shared = geometry::intersection(box, rect::from_sides(3, 9, 4, 0));
    REQUIRE(shared);
    REQUIRE(geometry::same_sides(*shared, rect::from_sides(3, 5, 4, 2)));
}

TEST_CASE("custom_coordinate_type", "rectangle") {
    using tick_rect = geometry::basic_rect<test::tick>;
    const tick_rect r = tick_rect::from_sides(test::tick(0), test::tick(3), test::tick(2), test::tick(0));

    REQUIRE(geometry::perimeter(r) == test::tick(10));
    REQUIRE(geometry::area(r) == test::tick(6));
    REQUIRE(geometry::contains_point(r, test::tick(3), test::tick(2)));
    REQUIRE(geometry::translate(r, test::tick(1), test::tick(1)).left() == test::tick(1));
}
