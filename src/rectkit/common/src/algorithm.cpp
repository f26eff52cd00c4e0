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

#include <cctype>

namespace rectkit {
    namespace common {
        int compare_ignore_case(const char *s1, const char *s2) {
            const std::size_t s1_len = std::strlen(s1);
            const std::size_t s2_len = std::strlen(s2);

            for (std::size_t i = 0; i < common::min<std::size_t>(s1_len, s2_len); i++) {
                const int t1 = std::tolower(static_cast<unsigned char>(s1[i]));
                const int t2 = std::tolower(static_cast<unsigned char>(s2[i]));

                if (t1 > t2) {
                    return 1;
                } else if (t1 < t2) {
                    return -1;
                }
            }

            if (s1_len == s2_len)
                return 0;

            if (s1_len > s2_len) {
                return 1;
            }

            return -1;
        }

        std::string trim_spaces(std::string str) {
            std::string::iterator new_end = std::unique(str.begin(), str.end(), [](char lhs, char rhs) {
                return (lhs == rhs) && (lhs == ' ');
            });

            str.erase(new_end, str.end());

            while (str.length() > 0 && str[0] == ' ') {
                str.erase(str.begin());
            }

            while (str.length() > 0 && str.back() == ' ') {
                str.erase(str.length() - 1);
            }

            return str;
        }

        std::vector<std::string> split_string(const std::string &str, const char separator) {
            std::vector<std::string> pieces;
            std::size_t start = 0;

            while (start <= str.length()) {
                std::size_t end = str.find(separator, start);
                if (end == std::string::npos) {
                    end = str.length();
                }

                if (end != start) {
                    pieces.push_back(str.substr(start, end - start));
                }

                start = end + 1;
            }

            return pieces;
        }
    }
}
