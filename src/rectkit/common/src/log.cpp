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

#include <common/algorithm.h>
#include <common/log.h>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <mutex>

#ifdef _MSC_VER
#include <spdlog/sinks/msvc_sink.h>
#endif

#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rectkit {
    const char *log_class_to_string(const log_class cls) {
        if (cls >= LOG_CLASS_COUNT) {
            return nullptr;
        }

#define LOGCLASS(name, short_nice_name, nice_name) short_nice_name,
        static const char *LOG_CLASS_NAME_ARRAYS[LOG_CLASS_COUNT] = {
#include <common/logclass.def>
#undef LOGCLASS
        };

        return LOG_CLASS_NAME_ARRAYS[static_cast<int>(cls)];
    }

    bool string_to_log_class(const char *str, log_class &result) {
#define LOGCLASS(name, short_nice_name, nice_name) if (rectkit::common::compare_ignore_case(short_nice_name, str) == 0) { result = name; return true; }
#include <common/logclass.def>
#undef LOGCLASS

        return false;
    }

    bool string_to_log_level(const char *str, spdlog::level::level_enum &level) {
        if (common::compare_ignore_case(str, "Debug") == 0) {
            level = spdlog::level::debug;
            return true;
        }

        if ((common::compare_ignore_case(str, "Error") == 0) || (common::compare_ignore_case(str, "Err") == 0)) {
            level = spdlog::level::err;
            return true;
        }

        if (common::compare_ignore_case(str, "Trace") == 0) {
            level = spdlog::level::trace;
            return true;
        }

        if ((common::compare_ignore_case(str, "Warn") == 0) || (common::compare_ignore_case(str, "Warning") == 0)) {
            level = spdlog::level::warn;
            return true;
        }

        if (common::compare_ignore_case(str, "Critical") == 0) {
            level = spdlog::level::critical;
            return true;
        }

        if (common::compare_ignore_case(str, "Info") == 0) {
            level = spdlog::level::info;
            return true;
        }

        if (common::compare_ignore_case(str, "Off") == 0) {
            level = spdlog::level::off;
            return true;
        }

        return false;
    }

    log_filterings::log_filterings() {
        reset_all(spdlog::level::trace);
    }

    bool log_filterings::set_minimum_level(const log_class cls, const spdlog::level::level_enum level) {
        if (cls >= LOG_CLASS_COUNT) {
            return false;
        }

        levels_[static_cast<int>(cls)] = level;
        return true;
    }

    bool log_filterings::is_passed(const log_class cls, const spdlog::level::level_enum level) {
        return (cls < LOG_CLASS_COUNT) && (level != spdlog::level::off) && (level >= levels_[static_cast<int>(cls)]);
    }

    void log_filterings::reset_all(const spdlog::level::level_enum level) {
        std::fill(levels_, levels_ + LOG_CLASS_COUNT, level);
    }

    void log_filterings::parse_filter_string(const std::string &filtering_str) {
        const std::vector<std::string> rules = common::split_string(common::trim_spaces(filtering_str), ' ');

        for (const std::string &rule : rules) {
            const std::vector<std::string> comp = common::split_string(rule, ':');
            if (comp.size() != 2) {
                LOG_ERROR(COMMON, "Rule {} is invalid (valid format: <class>:<level>)!", rule);
                continue;
            }

            spdlog::level::level_enum level_in_rule;
            if (!string_to_log_level(comp[1].c_str(), level_in_rule)) {
                LOG_ERROR(COMMON, "Unrecognised level {} in rule {}", comp[1], rule);
                continue;
            }

            if (comp[0] == "*") {
                reset_all(level_in_rule);
            } else {
                log_class class_in_rule;
                if (!string_to_log_class(comp[0].c_str(), class_in_rule)) {
                    LOG_ERROR(COMMON, "Unrecognized class {} in rule {}", comp[0], rule);
                } else {
                    set_minimum_level(class_in_rule, level_in_rule);
                }
            }
        }
    }

    namespace log {
        std::shared_ptr<spdlog::logger> spd_logger;
        std::unique_ptr<log_filterings> filterings;
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_color_sink;
        std::shared_ptr<spdlog::sinks::dist_sink_mt> color_dist_sink;

        bool console_shown = false;

        struct extra_logger_sink : public spdlog::sinks::base_sink<std::mutex> {
            explicit extra_logger_sink(std::shared_ptr<base_logger> _logger)
                : logger(std::move(_logger)) {}

        private:
            std::shared_ptr<base_logger> logger;

        protected:
            void sink_it_(const spdlog::details::log_msg &msg) override {
                spdlog::memory_buf_t formatted;
                base_sink<std::mutex>::formatter_->format(msg, formatted);

                const std::string real_msg = fmt::to_string(formatted);
                logger->log(real_msg.c_str());
            }

            void flush_() override {
            }
        };

        void setup_log(std::shared_ptr<base_logger> extra_logger, const char *log_file_name) {
            std::vector<spdlog::sink_ptr> sinks;

            color_dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
            sinks.push_back(color_dist_sink);

            if (log_file_name && (log_file_name[0] != '\0')) {
                // Truncate, each run gets a fresh log
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_name, true));
            }

#ifdef _MSC_VER
            sinks.push_back(std::make_shared<spdlog::sinks::msvc_sink_st>());
#endif
            if (extra_logger) {
                sinks.push_back(std::make_shared<extra_logger_sink>(std::move(extra_logger)));
            }

            spd_logger = std::make_shared<spdlog::logger>("rectkit Logger", begin(sinks), end(sinks));
            spdlog::set_default_logger(spd_logger);

            spdlog::set_error_handler([](const std::string &msg) {
                std::cerr << "spdlog error: " << msg << std::endl;
            });

            spdlog::set_pattern("%L %^%v%$");
            spdlog::set_level(spdlog::level::trace);

            spd_logger->flush_on(spdlog::level::debug);

            if (console_shown) {
                stdout_color_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                stdout_color_sink->set_pattern("%L %^%v%$");
                color_dist_sink->add_sink(stdout_color_sink);
            }

            // Setup the filterings
            filterings = std::make_unique<log_filterings>();
        }

        void toggle_console() {
            if (!spd_logger) {
                return;
            }

            if (!console_shown) {
                stdout_color_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                stdout_color_sink->set_pattern("%L %^%v%$");
                stdout_color_sink->set_level(spdlog::level::trace);

                color_dist_sink->add_sink(stdout_color_sink);
                console_shown = true;
            } else {
                console_shown = false;
                color_dist_sink->remove_sink(stdout_color_sink);
                stdout_color_sink.reset();
            }
        }

        bool is_console_enabled() {
            return console_shown;
        }

        bool is_passed(const log_class cls, const spdlog::level::level_enum level) {
            return spd_logger && filterings && filterings->is_passed(cls, level);
        }
    }
}
