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
#include <geometry/rectangle.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace rectkit::geometry {
    struct sweep_options {
        /**
         * Ignore obstructions lying completely below the region. Their x-span would otherwise still
         * produce event lines and gaps reaching under the region's bottom.
         */
        bool clip_obstructions = true;

        bool trace = false; ///< Log every event line.
    };

    namespace detail {
        void log_sweep_begin(const std::size_t obstruction_count, const std::size_t line_count);
        void log_sweep_line(const std::size_t index, const bool opens, const bool closes, const std::size_t gap_count,
            const std::size_t active_count);
        void log_sweep_end(const std::size_t rect_count);
    }

    /**
     * \brief Split the free area of a region into rectangles.
     * 
     * A vertical line sweeps from the left side of the region to its right side, stopping at every
     * obstruction's left side and just after every obstruction's right side. At each stop the free
     * vertical intervals (gaps) are collected, and rectangles that no longer fit a gap are finished there.
     * 
     * A rectangle is kept open for as long as its top and bottom fit in a gap, so the pieces stretch as
     * far right as possible. No two open rectangles ever have the same top and bottom.
     * 
     * Only the obstructions' x-span is clipped to the region. See sweep_options for the vertical axis.
     * 
     * \param parent       The region to split.
     * \param obstructions Borrowed list of obstructions. Type may differ from the region's, but the
     *                     coordinate type must be the same.
     * \param options      Sweep behaviour switches.
     * 
     * \returns New rectangles covering the unobstructed area, empty if the region is fully covered.
     */
    template <typename R, typename O>
    std::vector<R> unobstructed_subrects(const R &parent, const std::vector<const O *> &obstructions,
        const sweep_options &options = sweep_options{}) {
        static_assert(same_coord_v<R, O>, "Obstructions must share the region's coordinate type");

        using parent_traits = rect_traits<R>;
        using obstruct_traits = rect_traits<O>;
        using unit = coord_of<R>;

        struct unfinished_rect {
            unit left;
            unit top;
            unit bottom;
        };

        struct gap {
            unit top;
            unit bottom;
        };

        struct sweep_line {
            unit x;
            bool opens;
            bool closes;
        };

        const unit one = coord_one<unit>();

        const unit parent_left = parent_traits::left(parent);
        const unit parent_right = parent_traits::right(parent);
        const unit parent_top = parent_traits::top(parent);
        const unit parent_bottom = parent_traits::bottom(parent);

        std::vector<const O *> sorted;
        sorted.reserve(obstructions.size());

        for (const O *obstruction : obstructions) {
            if (options.clip_obstructions && (obstruct_traits::top(*obstruction) < parent_bottom)) {
                continue;
            }

            sorted.push_back(obstruction);
        }

        // Roof shingles: highest top first
        std::stable_sort(sorted.begin(), sorted.end(), [](const O *lhs, const O *rhs) {
            return obstruct_traits::top(*rhs) < obstruct_traits::top(*lhs);
        });

        std::vector<sweep_line> lines;
        lines.reserve(sorted.size() * 2 + 1);
        lines.push_back({ parent_left, true, false });

        for (const O *obstruction : sorted) {
            // Gaps may close at the left side and open again right after the right side
            lines.push_back({ obstruct_traits::left(*obstruction), false, true });
            lines.push_back({ obstruct_traits::right(*obstruction) + one, true, false });
        }

        std::stable_sort(lines.begin(), lines.end(), [](const sweep_line &lhs, const sweep_line &rhs) {
            return lhs.x < rhs.x;
        });

        // Fold lines sharing a position into one, keeping both roles
        std::vector<sweep_line> merged;
        merged.reserve(lines.size());

        for (const sweep_line &line : lines) {
            if ((line.x < parent_left) || (parent_right < line.x)) {
                continue;
            }

            if (!merged.empty() && (merged.back().x == line.x)) {
                merged.back().opens = merged.back().opens || line.opens;
                merged.back().closes = merged.back().closes || line.closes;
            } else {
                merged.push_back(line);
            }
        }

        detail::log_sweep_begin(sorted.size(), merged.size());

        const auto has_shape = [](const std::vector<unfinished_rect> &rects, const unit top, const unit bottom) {
            return common::find_and_ret_if(rects, [&](const unfinished_rect &rect) {
                return (rect.top == top) && (rect.bottom == bottom);
            }) != nullptr;
        };

        std::vector<R> finished;
        std::vector<unfinished_rect> actives;
        std::vector<gap> gaps;

        for (std::size_t i = 0; i < merged.size(); i++) {
            const sweep_line &line = merged[i];
            gaps.clear();

            // Walk down the obstructions crossing this line, anything between two of them is free
            unit cursor = parent_top;

            for (const O *obstruction : sorted) {
                const unit obstruct_top = obstruct_traits::top(*obstruction);

                if ((line.x < obstruct_traits::left(*obstruction)) || (obstruct_traits::right(*obstruction) < line.x)) {
                    continue;
                }

                if (obstruct_top < cursor) {
                    gaps.push_back({ cursor, obstruct_top + one });
                }

                // Take the lowest point, a later obstruction starting higher must not fake a gap
                cursor = common::min(cursor, obstruct_traits::bottom(*obstruction) - one);
            }

            if (cursor >= parent_bottom) {
                gaps.push_back({ cursor, parent_bottom });
            }

            if (line.closes) {
                std::vector<unfinished_rect> kept;
                std::vector<unfinished_rect> continued;

                for (const unfinished_rect &rect : actives) {
                    const bool still_fits = std::any_of(gaps.begin(), gaps.end(), [&](const gap &g) {
                        return (g.top >= rect.top) && (rect.bottom >= g.bottom);
                    });

                    if (still_fits) {
                        kept.push_back(rect);
                        continue;
                    }

                    finished.push_back(parent_traits::from_sides(rect.left, line.x - one, rect.top, rect.bottom));

                    // Carry on with whatever part of the shape is still free
                    for (const gap &g : gaps) {
                        if (!((g.top <= rect.top) || (rect.bottom <= g.bottom))) {
                            continue;
                        }

                        const unit top_limit = common::min(rect.top, g.top);
                        const unit bottom_limit = common::max(rect.bottom, g.bottom);

                        if (top_limit < bottom_limit) {
                            continue;
                        }

                        if (has_shape(actives, top_limit, bottom_limit) || has_shape(continued, top_limit, bottom_limit)) {
                            continue;
                        }

                        continued.push_back({ line.x, top_limit, bottom_limit });
                    }
                }

                actives = std::move(kept);
                actives.insert(actives.end(), continued.begin(), continued.end());
            }

            if (line.opens) {
                for (const gap &g : gaps) {
                    if (!has_shape(actives, g.top, g.bottom)) {
                        actives.push_back({ line.x, g.top, g.bottom });
                    }
                }
            }

            if (options.trace) {
                detail::log_sweep_line(i, line.opens, line.closes, gaps.size(), actives.size());
            }
        }

        for (const unfinished_rect &rect : actives) {
            finished.push_back(parent_traits::from_sides(rect.left, parent_right, rect.top, rect.bottom));
        }

        detail::log_sweep_end(finished.size());
        return finished;
    }

    template <typename R, typename O>
    std::vector<R> unobstructed_subrects(const R &parent, const std::vector<O> &obstructions,
        const sweep_options &options = sweep_options{}) {
        std::vector<const O *> borrowed;
        borrowed.reserve(obstructions.size());

        for (const O &obstruction : obstructions) {
            borrowed.push_back(&obstruction);
        }

        return unobstructed_subrects(parent, borrowed, options);
    }
}
