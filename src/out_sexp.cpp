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

#include <cmath>
#include <string>
#include <iostream>
#include <iomanip>

#include <slidify.hpp>

using namespace slidify;
using namespace std;

namespace {

string quoted(const string &s) {
    string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += "\"";
    return out;
}

const char *shape_kind_name(ShapeKind kind) {
    switch (kind) {
        case SHAPE_ROUND_RECT: return "round-rect";
        case SHAPE_ELLIPSE: return "ellipse";
        default: return "rect";
    }
}

const char *align_name(TextAlign align) {
    switch (align) {
        case ALIGN_LEFT: return "left";
        case ALIGN_RIGHT: return "right";
        default: return "center";
    }
}

} /* anonymous namespace */

SexpSlideOutput::SexpSlideOutput(ostream &out, bool only_shapes, int digits_frac)
    : StreamShapeSink(out, only_shapes),
    m_digits_frac(digits_frac)
{
}

void SexpSlideOutput::header_impl(const RenderSettings &rset, size_t slide_count) {
    m_out << "(deck (version " << lib_version << ")"
          << " (size " << round_units(rset.slide_width_in * emu_per_in) << " " << round_units(rset.slide_height_in * emu_per_in) << ")"
          << " (sizing " << (rset.sizing == SIZING_VIEWPORT_PERCENT ? "percent" : "fit") << ")"
          << " (slides " << slide_count << ")" << endl;
}

void SexpSlideOutput::begin_slide_impl(const SlideContext &ctx, size_t index) {
    const Rect &vp = ctx.viewport();
    const LogicalBox &lb = ctx.logical_box();
    m_out << "  (slide " << (index + 1)
          << " (viewport " << setprecision(m_digits_frac) << vp.width << " " << vp.height << ")"
          << " (view-box " << lb.min_x << " " << lb.min_y << " " << lb.width << " " << lb.height << ")" << endl;
    m_in_slide = true;
}

void SexpSlideOutput::end_slide_impl() {
    m_out << "  )" << endl;
    m_in_slide = false;
}

void SexpSlideOutput::footer_impl() {
    m_out << ")" << endl;
}

/* Primitives nest one level deeper inside a slide block */
const char *SexpSlideOutput::indent() const {
    return m_in_slide ? "    " : "  ";
}

namespace {

void write_box(ostream &os, const SlideMetrics &m, int digits) {
    os << " (at " << m.x.str(digits) << " " << m.y.str(digits) << ") (size " << m.w << " " << m.h << ")";
}

void write_color(ostream &os, const char *tag, const ColorDescriptor &c, int digits) {
    os << " (" << tag << " " << quoted(c.hex) << " " << setprecision(digits) << c.alpha << ")";
}

void write_font(ostream &os, const FontDescriptor &f, int digits) {
    os << " (font " << quoted(f.family) << " " << setprecision(digits) << f.size_pt;
    if (f.bold)
        os << " bold";
    if (f.italic)
        os << " italic";
    if (f.underline)
        os << " underline";
    if (f.strike)
        os << " strike";
    os << ")";
}

void write_align(ostream &os, const Alignment &a) {
    os << " (align " << align_name(a.align) << (a.auto_fit ? " auto-fit" : "") << ")";
}

void write_line_style(ostream &os, const LineStyle &l, int digits) {
    os << " (line " << quoted(l.color.hex) << " " << setprecision(digits) << l.color.alpha
       << " " << l.weight_emu << " " << (l.dash == DASH_DASHED ? "dashed" : "solid") << ")";
}

} /* anonymous namespace */

SexpSlideOutput &SexpSlideOutput::operator<<(const ShapePrimitive &shape) {
    m_out << indent() << "(shape " << shape_kind_name(shape.kind);
    if (!shape.id.empty())
        m_out << " (id " << quoted(shape.id) << ")";
    write_box(m_out, shape.metrics, m_digits_frac);
    write_color(m_out, "fill", shape.fill, m_digits_frac);
    if (shape.has_line)
        write_line_style(m_out, shape.line, m_digits_frac);
    if (shape.kind == SHAPE_ROUND_RECT)
        m_out << " (radius " << setprecision(m_digits_frac) << shape.radius_ratio << ")";
    m_out << ")" << endl;
    return *this;
}

SexpSlideOutput &SexpSlideOutput::operator<<(const TextPrimitive &text) {
    m_out << indent() << "(text " << quoted(text.text);
    if (!text.id.empty())
        m_out << " (id " << quoted(text.id) << ")";
    write_box(m_out, text.metrics, m_digits_frac);
    write_font(m_out, text.font, m_digits_frac);
    write_color(m_out, "color", text.color, m_digits_frac);
    write_align(m_out, text.alignment);
    m_out << ")" << endl;
    return *this;
}

SexpSlideOutput &SexpSlideOutput::operator<<(const LinePrimitive &line) {
    m_out << indent() << "(connector";
    if (!line.id.empty())
        m_out << " (id " << quoted(line.id) << ")";
    m_out << " (from " << line.points.start.x.str(m_digits_frac) << " " << line.points.start.y.str(m_digits_frac) << ")"
          << " (to " << line.points.end.x.str(m_digits_frac) << " " << line.points.end.y.str(m_digits_frac) << ")";
    write_line_style(m_out, line.line, m_digits_frac);
    m_out << ")" << endl;
    return *this;
}

SexpSlideOutput &SexpSlideOutput::operator<<(const PlaceholderToken &tok) {
    m_out << indent() << "(placeholder " << quoted(tok.name);
    write_box(m_out, tok.metrics, m_digits_frac);
    write_font(m_out, tok.font, m_digits_frac);
    write_color(m_out, "color", tok.color, m_digits_frac);
    write_align(m_out, tok.alignment);
    m_out << ")" << endl;
    return *this;
}
