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

#include <common/log.h>
#include <geometry/sweep.h>

#include <memory>
#include <string>

namespace rectkit::config {
    static constexpr const char *DEFAULT_CONFIG_FILE = "rectkit.yml";

#if RECTKIT_DEBUG_LOG
    static constexpr const char *DEFAULT_LOG_FILTERING = rectkit::LOG_FILTER_DEBUG_PRESET;
#else
    static constexpr const char *DEFAULT_LOG_FILTERING = rectkit::LOG_FILTER_DEFAULT_PRESET;
#endif

    struct state {
        std::string log_filter{ DEFAULT_LOG_FILTERING };
        std::string log_file;

        bool clip_obstructions{ true };
        bool trace_sweep{ false };

        /**
         * \brief Write the settings to a YAML file.
         * \returns False if the file can not be written.
         */
        bool serialize(const std::string &path = DEFAULT_CONFIG_FILE);

        /**
         * \brief Read the settings from a YAML file.
         * 
         * Keys missing or with a wrong type keep their default value.
         * 
         * \returns False if the file does not exist or is not valid YAML. Settings are left untouched then.
         */
        bool deserialize(const std::string &path = DEFAULT_CONFIG_FILE);

        geometry::sweep_options sweep() const;

        /*! \brief Apply the log filter to the running logger. */
        void apply_log_filter() const;

        /**
         * \brief Set up the logger with the log file from these settings, then apply the log filter.
         * \param extra_logger Extra logger receiving the log lines, can be null.
         */
        void setup_logging(std::shared_ptr<base_logger> extra_logger = nullptr) const;
    };
}
