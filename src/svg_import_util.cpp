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

#include <cstdlib>
#include <cctype>
#include <algorithm>
#include <sstream>
#include "svg_import_util.h"

using namespace std;

/* Parse the leading number of a CSS value the way parseFloat does: "12.5px" -> 12.5, "auto" -> default. */
double slidify::parse_css_number(const string &value, double default_value) {
    const char *c = value.c_str();
    char *endptr = nullptr;
    double out = strtod(c, &endptr);
    if (endptr == c || !isfinite(out))
        return default_value;

    return out;
}

/* Opacity-like factors: plain numbers or percentages, clamped to [0, 1], 1 if unparsable. */
double slidify::parse_opacity_factor(const string &value) {
    const char *c = value.c_str();
    char *endptr = nullptr;
    double out = strtod(c, &endptr);
    if (endptr == c || !isfinite(out))
        return 1.0;

    if (*endptr == '%')
        out /= 100.0;

    return std::clamp(out, 0.0, 1.0);
}

/* Absolute SVG/CSS length in px. Relative units (%, em, ...) yield the default. */
double slidify::parse_svg_length(const string &value, double default_value) {
    const char *c = value.c_str();
    char *endptr = nullptr;
    double out = strtod(c, &endptr);
    if (endptr == c || !isfinite(out))
        return default_value;

    string unit = to_lower(trim(endptr));
    if (unit.empty() || unit == "px")
        return out;
    else if (unit == "in")
        return out * 96.0;
    else if (unit == "cm")
        return out * 96.0 / 2.54;
    else if (unit == "mm")
        return out * 96.0 / 25.4;
    else if (unit == "pt")
        return out * 96.0 / 72.0;
    else if (unit == "pc")
        return out * 96.0 / 6.0;

    return default_value;
}

double slidify::svg_double_attr(const pugi::xml_node &node, const char *attr, double default_value) {
    const auto *val = node.attribute(attr).value();
    if (*val == '\0')
        return default_value;

    return parse_svg_length(val, default_value);
}

/* "min-x min-y width height", comma and/or whitespace separated. All four must be finite. */
bool slidify::parse_view_box(const string &value, double &x, double &y, double &w, double &h) {
    string copy(value);
    std::replace(copy.begin(), copy.end(), ',', ' ');
    istringstream vb_stream(copy);

    double parts[4];
    for (double &p : parts) {
        if (!(vb_stream >> p) || !isfinite(p))
            return false;
    }

    string rest;
    if (vb_stream >> rest)
        return false;

    x = parts[0], y = parts[1], w = parts[2], h = parts[3];
    return true;
}

string slidify::trim(const string &str) {
    auto first = str.find_first_not_of(" \t\r\n\f");
    if (first == string::npos)
        return string();

    auto last = str.find_last_not_of(" \t\r\n\f");
    return str.substr(first, last - first + 1);
}

string slidify::to_lower(string str) {
    transform(str.begin(), str.end(), str.begin(), [](unsigned char c){ return std::tolower(c); });
    return str;
}
