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

#include <cmath>
#include <cstdlib>
#include <string>
#include <map>
#include <sstream>
#include <iomanip>
#include <limits>

#include "svg_style.h"
#include "svg_import_util.h"

using namespace slidify;
using namespace std;

namespace {

struct StyleProperty {
    const char *name;
    string StyleSnapshot::*field;
    bool inherited;
    const char *initial;
};

/* Initial values follow SVG 1.1 / CSS 2 */
const StyleProperty style_properties[] = {
    {"display",          &StyleSnapshot::display,          false, "inline"},
    {"visibility",       &StyleSnapshot::visibility,       true,  "visible"},
    {"opacity",          &StyleSnapshot::opacity,          false, "1"},
    {"background-color", &StyleSnapshot::background_color, false, "transparent"},
    {"color",            &StyleSnapshot::color,            true,  "black"},
    {"fill",             &StyleSnapshot::fill,             true,  "black"},
    {"stroke",           &StyleSnapshot::stroke,           true,  "none"},
    {"fill-opacity",     &StyleSnapshot::fill_opacity,     true,  "1"},
    {"stroke-opacity",   &StyleSnapshot::stroke_opacity,   true,  "1"},
    {"border-color",     &StyleSnapshot::border_color,     false, "transparent"},
    {"border-width",     &StyleSnapshot::border_width,     false, "0"},
    {"stroke-width",     &StyleSnapshot::stroke_width,     true,  "1"},
    {"stroke-dasharray", &StyleSnapshot::stroke_dasharray, true,  "none"},
    {"font-family",      &StyleSnapshot::font_family,      true,  "sans-serif"},
    {"font-size",        &StyleSnapshot::font_size,        true,  "16px"},
    {"font-weight",      &StyleSnapshot::font_weight,      true,  "normal"},
    {"font-style",       &StyleSnapshot::font_style,       true,  "normal"},
    {"text-decoration",  &StyleSnapshot::text_decoration,  false, "none"},
    {"text-align",       &StyleSnapshot::text_align,       true,  ""},
    {"text-anchor",      &StyleSnapshot::text_anchor,      true,  "start"},
    {"border-radius",    &StyleSnapshot::border_radius,    false, "0"},
    {"padding-top",      &StyleSnapshot::padding_top,      false, "0"},
    {"padding-right",    &StyleSnapshot::padding_right,    false, "0"},
    {"padding-bottom",   &StyleSnapshot::padding_bottom,   false, "0"},
    {"padding-left",     &StyleSnapshot::padding_left,     false, "0"},
    {"margin-top",       &StyleSnapshot::margin_top,       false, "0"},
    {"margin-right",     &StyleSnapshot::margin_right,     false, "0"},
    {"margin-bottom",    &StyleSnapshot::margin_bottom,    false, "0"},
    {"margin-left",      &StyleSnapshot::margin_left,      false, "0"},
};

/* Properties whose computed value is an absolute length in px */
string StyleSnapshot::* const length_properties[] = {
    &StyleSnapshot::border_width,
    &StyleSnapshot::stroke_width,
    &StyleSnapshot::border_radius,
    &StyleSnapshot::padding_top,
    &StyleSnapshot::padding_right,
    &StyleSnapshot::padding_bottom,
    &StyleSnapshot::padding_left,
    &StyleSnapshot::margin_top,
    &StyleSnapshot::margin_right,
    &StyleSnapshot::margin_bottom,
    &StyleSnapshot::margin_left,
    &StyleSnapshot::rx,
    &StyleSnapshot::ry,
};

constexpr double default_font_size_px = 16.0;

string px_string(double px) {
    ostringstream os;
    os << setprecision(numeric_limits<double>::max_digits10) << px << "px";
    return os.str();
}

/* Absolute lengths become "<n>px". Anything else (percentages, keywords) is kept as written. */
string normalize_length(const string &value) {
    double px = parse_svg_length(value);
    if (std::isnan(px))
        return value;
    return px_string(px);
}

/* font-size additionally resolves em and % against the parent's font size */
string normalize_font_size(const string &value, const StyleSnapshot *parent) {
    double px = parse_svg_length(value);
    if (!std::isnan(px))
        return px_string(px);

    const char *c = value.c_str();
    char *endptr = nullptr;
    double num = strtod(c, &endptr);
    if (endptr == c || !std::isfinite(num))
        return value;

    double parent_px = parent ? parse_svg_length(parent->font_size, default_font_size_px) : default_font_size_px;
    string unit = to_lower(trim(endptr));
    if (unit == "em")
        return px_string(num * parent_px);
    else if (unit == "%")
        return px_string(num * parent_px / 100.0);
    else if (unit == "rem")
        return px_string(num * default_font_size_px);

    return value;
}

/* CSS-wide keywords, treated the way the cascade would */
bool is_inherit(const string &value) {
    return value == "inherit";
}

bool is_initial(const string &value) {
    return value == "initial" || value == "unset";
}

} /* anonymous namespace */

map<string, string> slidify::parse_style_declarations(const string &style) {
    map<string, string> out;
    size_t pos = 0;
    while (pos < style.size()) {
        size_t end = style.find(';', pos);
        if (end == string::npos)
            end = style.size();

        string decl = style.substr(pos, end - pos);
        auto colon = decl.find(':');
        if (colon != string::npos) {
            string name = to_lower(trim(decl.substr(0, colon)));
            string value = trim(decl.substr(colon + 1));

            auto important = value.find("!important");
            if (important != string::npos)
                value = trim(value.substr(0, important));

            if (!name.empty())
                out[name] = value;
        }

        pos = end + 1;
    }
    return out;
}

StyleSnapshot slidify::collect_style(const pugi::xml_node &node, const StyleSnapshot *parent) {
    StyleSnapshot out;
    out.tag = node.name();
    out.id = node.attribute("id").value();
    out.name = node.attribute("name").value();
    out.class_name = node.attribute("class").value();

    auto decls = parse_style_declarations(node.attribute("style").value());

    for (const auto &prop : style_properties) {
        string value;
        auto it = decls.find(prop.name);
        if (it != decls.end()) {
            value = it->second;
        } else {
            value = trim(node.attribute(prop.name).value());
        }

        if (is_initial(value)) {
            value = prop.initial;

        } else if (value.empty() || is_inherit(value)) {
            if (parent && (prop.inherited || is_inherit(value))) {
                value = parent->*(prop.field);
            } else {
                value = prop.initial;
            }
        }

        out.*(prop.field) = value;
    }

    /* Paint servers referencing the current text color */
    if (to_lower(out.fill) == "currentcolor")
        out.fill = out.color;
    if (to_lower(out.stroke) == "currentcolor")
        out.stroke = out.color;
    if (to_lower(out.border_color) == "currentcolor")
        out.border_color = out.color;

    /* Group opacity composes down the tree */
    if (parent) {
        out.ancestor_opacity = parent->ancestor_opacity * parse_opacity_factor(parent->opacity);
    }

    /* rx/ry are geometry attributes, not styles. A missing one mirrors the other. */
    out.rx = trim(node.attribute("rx").value());
    out.ry = trim(node.attribute("ry").value());
    if (out.rx.empty())
        out.rx = out.ry;
    if (out.ry.empty())
        out.ry = out.rx;

    for (auto field : length_properties)
        out.*field = normalize_length(out.*field);
    out.font_size = normalize_font_size(out.font_size, parent);

    return out;
}
