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
#include <geometry/region.h>

#include "shapes.h"

#include <algorithm>

using namespace rectkit;
using geometry::rect;

TEST_CASE("new_region_is_free", "region") {
    geometry::region<rect> reg(rect::from_sides(0, 9, 9, 0));

    REQUIRE(reg.empty());
    REQUIRE_FALSE(reg.bounding_rect());
    REQUIRE_FALSE(reg.intersects(rect::from_sides(0, 9, 9, 0)));
    REQUIRE(reg.unobstructed() == std::vector<rect>({ reg.area_ }));
    REQUIRE_FALSE(reg.fully_obstructed());
}

TEST_CASE("add_obstruction_rules", "region") {
    geometry::region<rect> reg(rect::from_sides(0, 9, 9, 0));

    // Outside of the area, nothing to do
    REQUIRE_FALSE(reg.add_obstruction(rect::from_sides(20, 30, 9, 0)));
    REQUIRE(reg.empty());

    REQUIRE(reg.add_obstruction(rect::from_sides(2, 3, 3, 2)));
    REQUIRE(reg.add_obstruction(rect::from_sides(6, 7, 8, 6)));
    REQUIRE(reg.obstructions_.size() == 2);

    // Already covered
    REQUIRE_FALSE(reg.add_obstruction(rect::from_sides(2, 2, 3, 3)));
    REQUIRE(reg.obstructions_.size() == 2);

    // Covers the first one, which goes away
    REQUIRE(reg.add_obstruction(rect::from_sides(1, 4, 4, 1)));
    REQUIRE(reg.obstructions_.size() == 2);
    REQUIRE(reg.obstructions_.back() == rect::from_sides(1, 4, 4, 1));

    REQUIRE(reg.bounding_rect() == rect::from_sides(1, 7, 8, 1));
    REQUIRE(reg.intersects(rect::from_sides(4, 5, 1, 0)));
    REQUIRE_FALSE(reg.intersects(rect::from_sides(5, 5, 9, 0)));

    reg.make_empty();
    REQUIRE(reg.empty());
}

TEST_CASE("region_decomposes_its_area", "region") {
    geometry::region<rect> reg(rect::from_sides(0, 5, 5, 0));
    REQUIRE(reg.add_obstruction(rect::from_sides(0, 2, 5, 1)));

    const std::vector<rect> pieces = reg.unobstructed();

    REQUIRE(pieces.size() == 2);
    REQUIRE(std::find(pieces.begin(), pieces.end(), rect::from_sides(0, 5, 0, 0)) != pieces.end());
    REQUIRE(std::find(pieces.begin(), pieces.end(), rect::from_sides(3, 5, 5, 0)) != pieces.end());

    REQUIRE(reg.add_obstruction(rect::from_sides(-1, 6, 6, -1)));
    REQUIRE(reg.obstructions_.size() == 1);
    REQUIRE(reg.fully_obstructed());
}

TEST_CASE("region_with_foreign_obstructions", "region") {
    geometry::region<rect, test::screen_box> reg(rect::from_sides(0, 9, 4, 0));

    REQUIRE(reg.add_obstruction(test::screen_box{ 3, 0, 5, 4 }));
    REQUIRE(reg.unobstructed() == std::vector<rect>({ rect::from_sides(0, 2, 4, 0), rect::from_sides(6, 9, 4, 0) }));

    const std::optional<test::screen_box> bound = reg.bounding_rect();
    REQUIRE(bound);
    REQUIRE(geometry::same_sides(*bound, rect::from_sides(3, 5, 4, 0)));
}
