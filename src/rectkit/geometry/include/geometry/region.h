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
#include <common/log.h>
#include <geometry/rectangle.h>
#include <geometry/sweep.h>

#include <optional>
#include <vector>

namespace rectkit::geometry {
    /**
     * \brief A rectangle area with obstructions placed over it.
     * 
     * \tparam R Type of the area, and of the free rectangles.
     * \tparam O Type of the obstructions.
     */
    template <typename R, typename O = R>
    struct region {
        R area_;
        std::vector<O> obstructions_;

        explicit region(const R &area)
            : area_(area) {
        }

        bool empty() const {
            return obstructions_.empty();
        }

        void make_empty() {
            obstructions_.clear();
        }

        /**
         * @brief       Add an obstruction to this region.
         * 
         * Obstructions already covered by the new one are dropped.
         * 
         * @returns     True if the new obstruction create modification to the region.
         */
        bool add_obstruction(const O &obstruction) {
            if (!overlaps(obstruction, area_)) {
                LOG_TRACE(GEOMETRY, "Obstruction does not touch the region, skipped");
                return false;
            }

            const O *cover = common::find_and_ret_if(obstructions_, [&](const O &existing) {
                return contains(existing, obstruction);
            });

            if (cover) {
                // Already covered, no modification done
                return false;
            }

            common::erase_elements(obstructions_, [&](const O &existing) {
                return contains(obstruction, existing);
            });

            obstructions_.push_back(obstruction);
            return true;
        }

        /**
         * @brief       Get the rectangle that bound all obstructions.
         * @returns     Rectangle that bound the obstructions, std::nullopt if there is none.
         */
        std::optional<O> bounding_rect() const {
            if (obstructions_.empty()) {
                return std::nullopt;
            }

            O bound = obstructions_[0];

            for (std::size_t i = 1; i < obstructions_.size(); i++) {
                bound = bounding_union(bound, obstructions_[i]);
            }

            return bound;
        }

        /**
         * @brief   Check intersection between a rectangle and the obstructions of this region.
         * 
         * @param   target    The rectangle to check intersection with.
         * @returns True if intersects.
         */
        template <typename T>
        bool intersects(const T &target) const {
            for (std::size_t i = 0; i < obstructions_.size(); i++) {
                if (overlaps(obstructions_[i], target)) {
                    return true;
                }
            }

            return false;
        }

        std::vector<R> unobstructed(const sweep_options &options = sweep_options{}) const {
            return unobstructed_subrects(area_, obstructions_, options);
        }

        bool fully_obstructed(const sweep_options &options = sweep_options{}) const {
            return unobstructed(options).empty();
        }
    };
}
