/*
 * This file is part of slidify, a vector slide conversion toolchain
 * Copyright (C) 2021 Jan Sebastian Götte <gerbolyze@jaseg.de>
 * Copyright (C) 2026 The slidify authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cmath>
#include <limits>
#include <string>

#include <pugixml.hpp>

namespace slidify {

double parse_css_number(const std::string &value, double default_value=0.0);
double parse_opacity_factor(const std::string &value);
double parse_svg_length(const std::string &value, double default_value=std::nan(""));
double svg_double_attr(const pugi::xml_node &node, const char *attr, double default_value=0.0);
bool parse_view_box(const std::string &value, double &x, double &y, double &w, double &h);
std::string trim(const std::string &str);
std::string to_lower(std::string str);

} /* namespace slidify */
