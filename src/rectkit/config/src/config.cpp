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
#include <config/config.h>

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace rectkit::config {
    template <typename T, typename Q = T>
    void get_yaml_value(const YAML::Node &config_node, const char *key, T *target_val, Q default_val) {
        try {
            const YAML::Node value_node = config_node[key];
            if (!value_node) {
                *target_val = std::move(default_val);
                return;
            }

            *target_val = value_node.as<T>();
        } catch (const YAML::Exception &ex) {
            LOG_WARN(CONFIG, "Option {} is invalid ({}), using default value", key, ex.what());
            *target_val = std::move(default_val);
        }
    }

    template <typename T>
    void config_file_emit_single(YAML::Emitter &emitter, const char *name, const T &val) {
        emitter << YAML::Key << name << YAML::Value << val;
    }

    bool state::serialize(const std::string &path) {
        YAML::Emitter emitter;
        emitter << YAML::BeginMap;

#define OPTION(name, variable, default) config_file_emit_single(emitter, #name, variable);
#include <config/options.inl>
#undef OPTION

        emitter << YAML::EndMap;

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file) {
            LOG_ERROR(CONFIG, "Unable to open {} for writing", path);
            return false;
        }

        file.write(emitter.c_str(), emitter.size());
        if (!file) {
            LOG_ERROR(CONFIG, "Failed to write configuration to {}", path);
            return false;
        }

        return true;
    }

    bool state::deserialize(const std::string &path) {
        YAML::Node node;

        try {
            node = YAML::LoadFile(path);
        } catch (const YAML::BadFile &) {
            LOG_WARN(CONFIG, "Configuration file {} not found, using defaults", path);
            return false;
        } catch (const YAML::ParserException &ex) {
            LOG_WARN(CONFIG, "Configuration file {} is malformed ({}), using defaults", path, ex.what());
            return false;
        }

        if (!node.IsMap()) {
            LOG_WARN(CONFIG, "Configuration file {} has no options, using defaults", path);
            return false;
        }

#define OPTION(name, variable, default_value) get_yaml_value(node, #name, &variable, default_value);
#include <config/options.inl>
#undef OPTION

        LOG_INFO(CONFIG, "Configuration loaded from {}", path);
        return true;
    }

    geometry::sweep_options state::sweep() const {
        geometry::sweep_options options;
        options.clip_obstructions = clip_obstructions;
        options.trace = trace_sweep;

        return options;
    }

    void state::apply_log_filter() const {
        if (!log::filterings) {
            return;
        }

        log::filterings->reset_all(spdlog::level::trace);
        log::filterings->parse_filter_string(log_filter);
    }

    void state::setup_logging(std::shared_ptr<base_logger> extra_logger) const {
        log::setup_log(std::move(extra_logger), log_file.c_str());
        apply_log_filter();
    }
}
