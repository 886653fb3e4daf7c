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
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <string>

#include <slidify.hpp>
#include "svg_import_util.h"

using namespace slidify;
using namespace std;

namespace {

/* Native vector shapes. These use their paint properties (fill/stroke) even when a box color is set, everything
 * else is assumed to be an HTML-emulated shape that paints with background-color/border-color. */
const std::array<const char *, 3> vector_shape_tags { "text", "rect", "g" };

const std::array<const char *, 5> bold_weights { "bold", "bolder", "600", "700", "800" };

bool alignment_for(const string &value, Alignment &out) {
    string v = to_lower(trim(value));
    if (v == "start" || v == "left") {
        out = Alignment { ALIGN_LEFT, false };
    } else if (v == "end" || v == "right") {
        out = Alignment { ALIGN_RIGHT, false };
    } else if (v == "center" || v == "middle") {
        out = Alignment { ALIGN_CENTER, false };
    } else if (v == "justify") {
        out = Alignment { ALIGN_LEFT, true };
    } else {
        return false;
    }
    return true;
}

} /* anonymous namespace */

bool slidify::is_vector_tag(const string &tag) {
    string t = to_lower(tag);
    return std::find(vector_shape_tags.begin(), vector_shape_tags.end(), t) != vector_shape_tags.end();
}

/* Colors only ever combine by multiplying alpha. The hex part is passed through untouched. */
ColorDescriptor slidify::color_descriptor(const RGBA &sample, double opacity) {
    ostringstream hex;
    hex << "#" << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(sample.r)
        << std::setw(2) << static_cast<int>(sample.g)
        << std::setw(2) << static_cast<int>(sample.b);

    double own_alpha = sample.a / 255.0;
    if (!isfinite(opacity))
        opacity = 1.0;

    ColorDescriptor out;
    out.hex = hex.str();
    out.alpha = own_alpha * std::clamp(opacity, 0.0, 1.0);
    return out;
}

ResolvedColors slidify::resolve_colors(const StyleSnapshot &style, const ColorSampler &sampler) {
    double own_opacity = parse_opacity_factor(style.opacity);
    if (isfinite(style.ancestor_opacity))
        own_opacity *= std::clamp(style.ancestor_opacity, 0.0, 1.0);

    bool vector_shape = is_vector_tag(style.tag);

    RGBA background = sampler.sample(style.background_color);
    RGBA border = sampler.sample(style.border_color);

    ResolvedColors out;
    out.background = color_descriptor(background, own_opacity);
    out.text = color_descriptor(sampler.sample(style.color), own_opacity);

    /* Box colors win only when they are actually visible. A transparent background must not shadow a fill. */
    if (!vector_shape && background.a > 0) {
        out.fill = out.background;
    } else {
        out.fill = color_descriptor(sampler.sample(style.fill), own_opacity * parse_opacity_factor(style.fill_opacity));
    }

    if (!vector_shape && border.a > 0) {
        out.stroke = color_descriptor(border, own_opacity);
    } else {
        out.stroke = color_descriptor(sampler.sample(style.stroke), own_opacity * parse_opacity_factor(style.stroke_opacity));
    }

    return out;
}

/* Declared stroke width in EMU, unrounded. stroke-width is preferred over border-width, the first positive finite
 * one wins. */
double slidify::resolve_stroke_width_units(const StyleSnapshot &style) {
    for (const string *val : {&style.stroke_width, &style.border_width}) {
        double px = parse_css_number(*val, 0.0);
        if (px > 0.0)
            return px * emu_per_px;
    }
    return 0.0;
}

/* false -> no line attribute should be emitted at all */
bool slidify::resolve_line_style(const StyleSnapshot &style, const ResolvedColors &colors, LineStyle &out) {
    double width = resolve_stroke_width_units(style);
    if (!(width > stroke_limit_emu))
        return false;

    if (!colors.stroke.visible())
        return false;

    out.color = colors.stroke;
    out.weight_emu = std::clamp<int64_t>(round_units(width), 1, static_cast<int64_t>(max_line_weight_emu));
    out.dash = resolve_dash(style);
    return true;
}

FontDescriptor slidify::resolve_font(const StyleSnapshot &style) {
    FontDescriptor out;

    string family = style.font_family.substr(0, style.font_family.find(','));
    family.erase(std::remove_if(family.begin(), family.end(), [](char c){ return c == '"' || c == '\''; }), family.end());
    out.family = trim(family);

    out.size_pt = parse_css_number(style.font_size, 0.0) * pt_per_in / px_per_in;

    string weight = to_lower(trim(style.font_weight));
    out.bold = std::find(bold_weights.begin(), bold_weights.end(), weight) != bold_weights.end();
    out.italic = to_lower(trim(style.font_style)) == "italic";

    string decoration = to_lower(style.text_decoration);
    out.underline = decoration.find("underline") != string::npos;
    out.strike = decoration.find("line-through") != string::npos;
    return out;
}

DashType slidify::resolve_dash(const StyleSnapshot &style) {
    string dash = to_lower(trim(style.stroke_dasharray));
    if (dash.empty() || dash == "none")
        return DASH_SOLID;

    return DASH_DASHED;
}

/* text-align first, then text-anchor, centered if neither says anything useful */
Alignment slidify::resolve_alignment(const StyleSnapshot &style) {
    Alignment out;
    if (alignment_for(style.text_align, out))
        return out;

    if (alignment_for(style.text_anchor, out))
        return out;

    return Alignment { ALIGN_CENTER, false };
}

double slidify::resolve_corner_radius_px(const StyleSnapshot &style) {
    double border_radius = parse_css_number(style.border_radius, 0.0);
    if (border_radius > 0.0)
        return border_radius;

    double rx = parse_css_number(style.rx, std::nan(""));
    double ry = parse_css_number(style.ry, std::nan(""));
    if (isnan(rx) || isnan(ry))
        return 0.0;

    return (rx + ry) / 2.0;
}
