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

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace rectkit {
    /*! \brief Contains functions that use frequently in the library */
    namespace common {
        template <typename T, typename F>
        void erase_elements(T &target, F condition) {
            auto it = target.begin();

            while (it != target.end()) {
                if (condition(*it)) {
                    it = target.erase(it);
                } else {
                    ++it;
                }
            }
        }

        template <typename C, typename F>
        typename C::value_type *find_and_ret_if(C &container, F if_func) {
            auto result = std::find_if(container.begin(), container.end(), if_func);
            if (result == container.end()) {
                return nullptr;
            }

            return &(*result);
        }

        template <typename C, typename F>
        const typename C::value_type *find_and_ret_if(const C &container, F if_func) {
            auto result = std::find_if(container.begin(), container.end(), if_func);
            if (result == container.end()) {
                return nullptr;
            }

            return &(*result);
        }

        /**
         * \brief Choose the greater variable 
         *
         * Compare two objects and choose the greater object to return.
         */
        template <typename T>
        constexpr T max(T a, T b) {
            return a > b ? a : b;
        }

        /** 
         * \brief Choose the less variable
         *
         * Compare two objects, choose the less object to return.
         */
        template <typename T>
        constexpr T min(T a, T b) {
            return a > b ? b : a;
        }

        /**
         * \brief Compare two ASCII string, ignoring it case
         * 
         * \param s1 Left hand string.
         * \param s2 Right hand string.
         * 
         * \returns -1 if s1 < s2
         *           0 if s1 == s2
         *           1 if s1 > s2
         */
        int compare_ignore_case(const char *s1, const char *s2);

        /**
         * \brief Trim all space duplication to only one space between words
         * 
         * \returns A new string contains all space trimmed
         */
        std::string trim_spaces(std::string str);

        /**
         * \brief Split a string by a separator.
         * 
         * Empty pieces are skipped.
         */
        std::vector<std::string> split_string(const std::string &str, const char separator);
    }
}
