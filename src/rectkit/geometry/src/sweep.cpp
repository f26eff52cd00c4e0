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

#include <common/log.h>
#include <geometry/sweep.h>

namespace rectkit::geometry::detail {
    void log_sweep_begin(const std::size_t obstruction_count, const std::size_t line_count) {
        LOG_DEBUG(SWEEP, "Sweeping {} obstructions over {} lines", obstruction_count, line_count);
    }

    void log_sweep_line(const std::size_t index, const bool opens, const bool closes, const std::size_t gap_count,
        const std::size_t active_count) {
        LOG_TRACE(SWEEP, "Line {} (opens: {}, closes: {}): {} gaps, {} active", index, opens, closes, gap_count,
            active_count);
    }

    void log_sweep_end(const std::size_t rect_count) {
        LOG_DEBUG(SWEEP, "Sweep finished with {} rectangles", rect_count);
    }
}
