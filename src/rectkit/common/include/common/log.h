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

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rectkit {
    enum log_class {
#define LOGCLASS(name, short_nice_name, nice_name) name,
#include <common/logclass.def>
#undef LOGCLASS
        LOG_CLASS_COUNT
    };

    static constexpr const char *LOG_FILTER_DEFAULT_PRESET = "*:Info";
    static constexpr const char *LOG_FILTER_DEBUG_PRESET = "*:Trace";

    const char *log_class_to_string(const log_class cls);
    bool string_to_log_class(const char *str, log_class &result);
    bool string_to_log_level(const char *str, spdlog::level::level_enum &level);

    /*! \brief Minimum level a message of each log class needs to be printed. */
    struct log_filterings {
        spdlog::level::level_enum levels_[LOG_CLASS_COUNT];

        explicit log_filterings();

        bool set_minimum_level(const log_class cls, const spdlog::level::level_enum level);
        bool is_passed(const log_class cls, const spdlog::level::level_enum level);
        void reset_all(const spdlog::level::level_enum level);

        /**
         * \brief Parse a filter string and apply its rules.
         * 
         * Rules are separated by space, each one has the form <class>:<level>.
         * Class can be * to target every log class. Invalid rules are reported and skipped.
         * 
         * \param filtering_str The filter string, for example "*:Info Sweep:Trace".
         */
        void parse_filter_string(const std::string &filtering_str);
    };

    /*! \brief Logger interface.
	 * 
	 * Host can receive formatted log lines by providing the library an interface.
	*/
    class base_logger {
    public:
        virtual ~base_logger() = default;

        virtual void log(const char *line) = 0;
        virtual void clear() = 0;
    };

    /*! \brief Contains function to setup logging. */
    namespace log {
        extern std::shared_ptr<spdlog::logger> spd_logger;
        extern std::unique_ptr<log_filterings> filterings;

        /*! \brief Set up the logging.
		    \param extra_logger The extra logger you want to receive the log lines.
		    \param log_file_name Name of the file to log to. Null or empty for no file.
		*/
        void setup_log(std::shared_ptr<base_logger> extra_logger, const char *log_file_name = nullptr);

        /*! \brief Attach or detach the colored console sink. */
        void toggle_console();
        bool is_console_enabled();

        /*! \brief Check if a message with given class and level should be printed. */
        bool is_passed(const log_class cls, const spdlog::level::level_enum level);
    }
}

#ifdef RECTKIT_DISABLE_LOGGING
    #define LOG_TRACE(cls, fmt, ...)
    #define LOG_DEBUG(cls, fmt, ...)
    #define LOG_INFO(cls, fmt, ...)
    #define LOG_WARN(cls, fmt, ...)
    #define LOG_ERROR(cls, fmt, ...)
    #define LOG_CRITICAL(cls, fmt, ...)
#else
    #define RECTKIT_LOG_IMPL(cls, lvl, fn, fmt, ...)                                        \
        do {                                                                                \
            if (rectkit::log::is_passed(rectkit::cls, spdlog::level::lvl))                  \
                rectkit::log::spd_logger->fn("{:s}: " fmt, __FUNCTION__, ##__VA_ARGS__);    \
        } while (false)

    #define LOG_TRACE(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, trace, trace, fmt, ##__VA_ARGS__)
    #define LOG_DEBUG(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, debug, debug, fmt, ##__VA_ARGS__)
    #define LOG_INFO(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, info, info, fmt, ##__VA_ARGS__)
    #define LOG_WARN(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, warn, warn, fmt, ##__VA_ARGS__)
    #define LOG_ERROR(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, err, error, fmt, ##__VA_ARGS__)
    #define LOG_CRITICAL(cls, fmt, ...) RECTKIT_LOG_IMPL(cls, critical, critical, fmt, ##__VA_ARGS__)
#endif
