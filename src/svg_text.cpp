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
#include <iostream>
#include <sstream>
#include <string>

#include "svg_text.h"
#include "svg_import_util.h"

using namespace slidify;
using namespace std;

TextMeasurer::TextMeasurer() : m_surface(nullptr), m_cr(nullptr) {
}

TextMeasurer::~TextMeasurer() {
    if (m_cr)
        cairo_destroy(m_cr);
    if (m_surface)
        cairo_surface_destroy(m_surface);
}

bool TextMeasurer::setup() {
    if (m_cr)
        return true;

    m_surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
    if (cairo_surface_status(m_surface) != CAIRO_STATUS_SUCCESS) {
        cerr << "Error: Cannot create cairo surface for text measurement" << endl;
        cairo_surface_destroy(m_surface);
        m_surface = nullptr;
        return false;
    }

    m_cr = cairo_create(m_surface);
    if (cairo_status(m_cr) != CAIRO_STATUS_SUCCESS) {
        cerr << "Error: Cannot create cairo context for text measurement" << endl;
        cairo_destroy(m_cr);
        m_cr = nullptr;
        return false;
    }
    return true;
}

bool TextMeasurer::measure(const string &text, const FontDescriptor &font, double size_px, TextExtents &out) {
    if (!(size_px > 0.0) || !isfinite(size_px))
        return false;

    if (!setup())
        return false;

    string family = font.family.empty() ? "sans-serif" : font.family;
    cairo_select_font_face(m_cr, family.c_str(),
            font.italic ? CAIRO_FONT_SLANT_ITALIC : CAIRO_FONT_SLANT_NORMAL,
            font.bold ? CAIRO_FONT_WEIGHT_BOLD : CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(m_cr, size_px);

    cairo_font_extents_t fe;
    cairo_font_extents(m_cr, &fe);
    cairo_text_extents_t te;
    cairo_text_extents(m_cr, text.c_str(), &te);

    if (cairo_status(m_cr) != CAIRO_STATUS_SUCCESS) {
        cerr << "Warning: Cannot measure text \"" << text << "\": " << cairo_status_to_string(cairo_status(m_cr)) << endl;
        return false;
    }

    out.advance = te.x_advance;
    out.ascent = fe.ascent;
    out.descent = fe.descent;
    return true;
}

namespace {

void collect_text(const pugi::xml_node &node, ostringstream &os) {
    for (const auto &child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            os << child.value();

        } else if (child.type() == pugi::node_element && string(child.name()) == "tspan") {
            collect_text(child, os);
        }
    }
}

/* x and y on <text> may be lists, the first entry positions the run */
double first_coordinate(const pugi::xml_node &node, const char *attr) {
    string val = node.attribute(attr).value();
    for (auto &c : val)
        if (c == ',')
            c = ' ';
    istringstream is(val);
    string first;
    is >> first;
    return parse_css_number(first, 0.0);
}

} /* anonymous namespace */

string slidify::text_content(const pugi::xml_node &node) {
    ostringstream os;
    collect_text(node, os);

    string out;
    bool space = false;
    for (char c : os.str()) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            space = true;
        } else {
            if (space && !out.empty())
                out += ' ';
            space = false;
            out += c;
        }
    }
    return out;
}

bool slidify::text_local_bounds(const pugi::xml_node &node, const StyleSnapshot &style, TextMeasurer &measurer, Rect &out) {
    string text = text_content(node);
    if (text.empty())
        return false;

    double size_px = parse_svg_length(style.font_size, 16.0);
    FontDescriptor font = resolve_font(style);

    TextExtents ext;
    if (!measurer.measure(text, font, size_px, ext))
        return false;

    double x = first_coordinate(node, "x");
    double y = first_coordinate(node, "y");

    string anchor = to_lower(trim(style.text_anchor));
    if (anchor == "middle") {
        x -= ext.advance / 2.0;
    } else if (anchor == "end") {
        x -= ext.advance;
    }

    out.x = x;
    out.y = y - ext.ascent;
    out.width = ext.advance;
    out.height = ext.ascent + ext.descent;
    return true;
}
