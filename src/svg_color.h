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

#include <string>

namespace slidify {

/* Color as parsed from CSS, channels in [0, 1] */
class RGBColor {
public:
    double r = 0.0, g = 0.0, b = 0.0, a = 1.0;

    /* true -> color could be parsed. "none", "currentColor", empty and garbage input are not colors. */
    bool parse(const std::string &css);

private:
    bool parse_hex(const std::string &hex);
    bool parse_rgb_function(const std::string &args);
    bool parse_hsl_function(const std::string &args);
    bool parse_named(const std::string &name);
};

} /* namespace slidify */
