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

#include <string>

#include <pugixml.hpp>
#include <cairo.h>

#include <slidify.hpp>

namespace slidify {

class TextExtents {
public:
    double advance = 0.0;
    double ascent = 0.0;
    double descent = 0.0;
};

/* Measures text runs with cairo's toy font API on a private scratch surface. The scratch surface is created on
 * first use. */
class TextMeasurer {
public:
    TextMeasurer();
    ~TextMeasurer();
    TextMeasurer(const TextMeasurer &) = delete;
    TextMeasurer &operator=(const TextMeasurer &) = delete;

    /* false -> cairo could not give us a usable measurement */
    bool measure(const std::string &text, const FontDescriptor &font, double size_px, TextExtents &out);

private:
    bool setup();

    cairo_surface_t *m_surface;
    cairo_t *m_cr;
};

/* Text content of a <text> element including its <tspan> children, whitespace-collapsed and trimmed. */
std::string text_content(const pugi::xml_node &node);

/* Local (untransformed) bounds of a <text> element's single line of text. */
bool text_local_bounds(const pugi::xml_node &node, const StyleSnapshot &style, TextMeasurer &measurer, Rect &out);

} /* namespace slidify */
