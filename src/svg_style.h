/*
 * This file is part of slidify, a vector slide conversion toolchain
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

#include <map>
#include <string>

#include <pugixml.hpp>

#include <slidify.hpp>

namespace slidify {

/* Build the computed style of an SVG element from its presentation attributes, its inline style attribute and its
 * parent's computed style. parent is nullptr for the root element. */
StyleSnapshot collect_style(const pugi::xml_node &node, const StyleSnapshot *parent);

/* "fill: red; stroke-width: 2px" -> {{"fill", "red"}, {"stroke-width", "2px"}} */
std::map<std::string, std::string> parse_style_declarations(const std::string &style);

} /* namespace slidify */
