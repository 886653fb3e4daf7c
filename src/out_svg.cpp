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
#include <algorithm>
#include <string>
#include <iostream>
#include <iomanip>

#include <slidify.hpp>

using namespace slidify;
using namespace std;

namespace {

string xml_escape(const string &s) {
    string out;
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

const char *text_anchor(TextAlign align) {
    switch (align) {
        case ALIGN_LEFT: return "start";
        case ALIGN_RIGHT: return "end";
        default: return "middle";
    }
}

int64_t anchor_x(TextAlign align, int64_t w) {
    switch (align) {
        case ALIGN_LEFT: return 0;
        case ALIGN_RIGHT: return w;
        default: return w / 2;
    }
}


/* Everything positioned goes into a nested viewport so percent coordinates need no arithmetic. */
void open_box(ostream &os, const SlideMetrics &m, int digits) {
    os << "<svg x=\"" << m.x.str(digits) << "\" y=\"" << m.y.str(digits) << "\" width=\"" << m.w
        << "\" height=\"" << m.h << "\" overflow=\"visible\">";
}

void write_paint(ostream &os, const char *attr, const ColorDescriptor &c, int digits) {
    os << " " << attr << "=\"" << c.hex << "\" " << attr << "-opacity=\"" << setprecision(digits) << c.alpha << "\"";
}

void write_stroke(ostream &os, const LineStyle &l, int digits) {
    write_paint(os, "stroke", l.color, digits);
    os << " stroke-width=\"" << l.weight_emu << "\"";
    if (l.dash == DASH_DASHED)
        os << " stroke-dasharray=\"" << (l.weight_emu * 4) << " " << (l.weight_emu * 2) << "\"";
}

} /* anonymous namespace */

SimpleSVGOutput::SimpleSVGOutput(ostream &out, bool only_shapes, int digits_frac)
    : StreamShapeSink(out, only_shapes),
    m_digits_frac(digits_frac)
{
}

/* Slides are stacked top to bottom, separated by a twentieth of the page height */
void SimpleSVGOutput::header_impl(const RenderSettings &rset, size_t slide_count) {
    int64_t w = round_units(rset.slide_width_in * emu_per_in);
    m_page_h = round_units(rset.slide_height_in * emu_per_in);
    m_page_gap = m_page_h / 20;

    int64_t n = std::max<int64_t>(1, static_cast<int64_t>(slide_count));
    int64_t h = n * m_page_h + (n - 1) * m_page_gap;
    m_out << "<svg width=\"" << setprecision(m_digits_frac) << (w / emu_per_in) << "in\" height=\""
        << setprecision(m_digits_frac) << (h / emu_per_in) << "in\" viewBox=\"0 0 "
        << w << " " << h << "\" xmlns=\"http://www.w3.org/2000/svg\">" << endl;
}

/* Each slide is its own viewport, so percentages resolve against the slide and not the whole deck */
void SimpleSVGOutput::begin_slide_impl(const SlideContext &ctx, size_t index) {
    int64_t w = round_units(ctx.output_width());
    int64_t h = round_units(ctx.output_height());
    m_out << "<svg id=\"slide-" << (index + 1) << "\" y=\"" << (static_cast<int64_t>(index) * (m_page_h + m_page_gap))
        << "\" width=\"" << w << "\" height=\"" << h << "\" overflow=\"visible\">" << endl;
    m_out << "<rect width=\"" << w << "\" height=\"" << h << "\" fill=\"none\" stroke=\"#c0c0c0\" stroke-width=\""
        << round_units(emu_per_px) << "\"/>" << endl;
}

void SimpleSVGOutput::end_slide_impl() {
    m_out << "</svg>" << endl;
}

SimpleSVGOutput &SimpleSVGOutput::operator<<(const ShapePrimitive &shape) {
    open_box(m_out, shape.metrics, m_digits_frac);

    if (shape.kind == SHAPE_ELLIPSE) {
        m_out << "<ellipse cx=\"" << (shape.metrics.w / 2) << "\" cy=\"" << (shape.metrics.h / 2)
            << "\" rx=\"" << (shape.metrics.w / 2) << "\" ry=\"" << (shape.metrics.h / 2) << "\"";
    } else {
        m_out << "<rect width=\"" << shape.metrics.w << "\" height=\"" << shape.metrics.h << "\"";
        if (shape.kind == SHAPE_ROUND_RECT) {
            m_out << " rx=\"" << round_units(shape.radius_ratio * std::min(shape.metrics.w, shape.metrics.h)) << "\"";
        }
    }

    write_paint(m_out, "fill", shape.fill, m_digits_frac);
    if (shape.has_line)
        write_stroke(m_out, shape.line, m_digits_frac);
    else
        m_out << " stroke=\"none\"";

    m_out << "/></svg>" << endl;
    return *this;
}

SimpleSVGOutput &SimpleSVGOutput::operator<<(const TextPrimitive &text) {
    open_box(m_out, text.metrics, m_digits_frac);

    m_out << "<text x=\"" << anchor_x(text.alignment.align, text.metrics.w) << "\" y=\"" << (text.metrics.h / 2)
        << "\" dominant-baseline=\"middle\" text-anchor=\"" << text_anchor(text.alignment.align) << "\""
        << " font-family=\"" << xml_escape(text.font.family) << "\""
        << " font-size=\"" << round_units(text.font.size_pt * emu_per_pt) << "\"";
    if (text.font.bold)
        m_out << " font-weight=\"bold\"";
    if (text.font.italic)
        m_out << " font-style=\"italic\"";
    if (text.font.underline || text.font.strike)
        m_out << " text-decoration=\"" << (text.font.underline ? "underline" : "")
            << (text.font.underline && text.font.strike ? " " : "")
            << (text.font.strike ? "line-through" : "") << "\"";
    write_paint(m_out, "fill", text.color, m_digits_frac);
    m_out << ">" << xml_escape(text.text) << "</text></svg>" << endl;
    return *this;
}

SimpleSVGOutput &SimpleSVGOutput::operator<<(const LinePrimitive &line) {
    const LineEndpoints &p = line.points;
    m_out << "<line x1=\"" << p.start.x.str(m_digits_frac) << "\" y1=\"" << p.start.y.str(m_digits_frac)
        << "\" x2=\"" << p.end.x.str(m_digits_frac) << "\" y2=\"" << p.end.y.str(m_digits_frac) << "\"";
    write_stroke(m_out, line.line, m_digits_frac);
    m_out << "/>" << endl;
    return *this;
}

/* Placeholders show up as dashed outlines carrying their name */
SimpleSVGOutput &SimpleSVGOutput::operator<<(const PlaceholderToken &tok) {
    open_box(m_out, tok.metrics, m_digits_frac);
    m_out << "<rect width=\"" << tok.metrics.w << "\" height=\"" << tok.metrics.h
        << "\" fill=\"none\" stroke=\"#808080\" stroke-width=\"" << round_units(emu_per_px) << "\" stroke-dasharray=\""
        << round_units(4 * emu_per_px) << "\"/>";
    m_out << "<text x=\"" << anchor_x(tok.alignment.align, tok.metrics.w) << "\" y=\"" << (tok.metrics.h / 2)
        << "\" dominant-baseline=\"middle\" text-anchor=\"" << text_anchor(tok.alignment.align) << "\""
        << " font-size=\"" << round_units(tok.font.size_pt * emu_per_pt) << "\"";
    write_paint(m_out, "fill", tok.color, m_digits_frac);
    m_out << ">" << xml_escape(tok.name) << "</text></svg>" << endl;
    return *this;
}

void SimpleSVGOutput::footer_impl() {
    m_out << "</svg>" << endl;
}
