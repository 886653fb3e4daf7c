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
#include <limits>
#include <algorithm>
#include <sstream>
#include <iomanip>

#include <slidify.hpp>
#include "svg_import_util.h"

using namespace slidify;
using namespace std;

namespace {

/* Zero, negative or non-finite extents would blow up the ratio math below. */
double safe_extent(double value, double fallback) {
    if (isfinite(value) && value > 0.0)
        return value;

    if (isfinite(fallback) && fallback > 0.0)
        return std::max(fallback, 1.0);

    return 1.0;
}

Coordinate project_axis(double ratio, double output_size, SizingMode mode) {
    if (!isfinite(ratio))
        return Coordinate(0);

    if (mode == SIZING_VIEWPORT_PERCENT && (ratio < 0.0 || ratio > 1.0))
        return Coordinate::percent(ratio * 100.0);

    return Coordinate(round_units(ratio * output_size));
}

int64_t project_extent(double ratio, double output_size) {
    return std::max<int64_t>(0, round_units(ratio * output_size));
}

} /* anonymous namespace */

slidify::SlideContext::SlideContext(const Rect &viewport, SizingMode mode, double output_width, double output_height) :
    SlideContext(viewport, LogicalBox { 0.0, 0.0, viewport.width, viewport.height }, mode, output_width, output_height)
{
}

slidify::SlideContext::SlideContext(const Rect &viewport, const LogicalBox &logical, SizingMode mode, double output_width, double output_height) :
    m_viewport(viewport),
    m_logical(logical),
    m_sizing(mode),
    m_output_width(isfinite(output_width) ? output_width : 0.0),
    m_output_height(isfinite(output_height) ? output_height : 0.0)
{
    m_viewport.width = safe_extent(viewport.width, 1.0);
    m_viewport.height = safe_extent(viewport.height, 1.0);
    if (!isfinite(m_viewport.x))
        m_viewport.x = 0.0;
    if (!isfinite(m_viewport.y))
        m_viewport.y = 0.0;

    m_logical.width = safe_extent(logical.width, m_viewport.width);
    m_logical.height = safe_extent(logical.height, m_viewport.height);
    if (!isfinite(m_logical.min_x))
        m_logical.min_x = 0.0;
    if (!isfinite(m_logical.min_y))
        m_logical.min_y = 0.0;
}

string slidify::Coordinate::str(int precision) const {
    ostringstream os;
    if (m_percent) {
        os << setprecision(precision) << m_percent_value << "%";
    } else {
        os << m_absolute;
    }
    return os.str();
}

/* Round half away from zero, nudged by one epsilon so values like 0.49999999999999994 that are really 0.5 land
 * where they belong. Results saturate at +-2^53, which keeps sums of two unit values inside int64_t. */
int64_t slidify::round_units(double value) {
    if (!isfinite(value))
        return 0;

    double rounded = std::round(value + std::numeric_limits<double>::epsilon());
    rounded = std::clamp(rounded, -max_units, max_units);
    return static_cast<int64_t>(rounded);
}

SlideMetrics slidify::resolve_metrics(const ElementRect &rect, const SlideContext &ctx) {
    const LogicalBox &lb = ctx.logical_box();

    /* Normalize to logical units, anchored at the logical box's top-left corner */
    double lx, ly, lw, lh;
    if (rect.space == SPACE_LOCAL) {
        lx = rect.x - lb.min_x;
        ly = rect.y - lb.min_y;
        lw = rect.width;
        lh = rect.height;

    } else {
        const Rect &vp = ctx.viewport();
        double sx = lb.width / vp.width;
        double sy = lb.height / vp.height;
        /* The viewport's top-left corner sits at the logical box origin */
        lx = (lb.min_x + (rect.x - vp.x) * sx) - lb.min_x;
        ly = (lb.min_y + (rect.y - vp.y) * sy) - lb.min_y;
        lw = rect.width * sx;
        lh = rect.height * sy;
    }

    SlideMetrics out;
    out.x = project_axis(lx / lb.width, ctx.output_width(), ctx.sizing());
    out.y = project_axis(ly / lb.height, ctx.output_height(), ctx.sizing());
    out.w = project_extent(lw / lb.width, ctx.output_width());
    out.h = project_extent(lh / lb.height, ctx.output_height());
    return out;
}

/* Map a local bounding box through the element's composed screen transform. All four corners are mapped since
 * the transform may mirror or skew the box, in which case two opposite corners do not span the result. */
bool slidify::transformed_bounds(const Rect &local, const xform2d &screen_ctm, ElementRect &out) {
    if (!screen_ctm.finite())
        return false;

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    for (const d2p &corner : {
            d2p {local.x,               local.y},
            d2p {local.x + local.width, local.y},
            d2p {local.x + local.width, local.y + local.height},
            d2p {local.x,               local.y + local.height}}) {
        d2p p = screen_ctm.doc2phys(corner);
        if (!isfinite(p[0]) || !isfinite(p[1]))
            return false;

        min_x = fmin(min_x, p[0]);
        min_y = fmin(min_y, p[1]);
        max_x = fmax(max_x, p[0]);
        max_y = fmax(max_y, p[1]);
    }

    out.x = min_x;
    out.y = min_y;
    out.width = max_x - min_x;
    out.height = max_y - min_y;
    out.space = SPACE_SCREEN;
    return true;
}

/* false -> at least one endpoint is not finite, do not emit this line. */
bool slidify::resolve_line_points(const d2p &p1, const d2p &p2, const xform2d &screen_ctm, const SlideContext &ctx, LineEndpoints &out) {
    for (double v : {p1[0], p1[1], p2[0], p2[1]}) {
        if (!isfinite(v))
            return false;
    }

    const Rect &vp = ctx.viewport();
    auto project = [&](const d2p &local, SlidePoint &pt) {
        d2p s = screen_ctm.doc2phys(local);
        if (!isfinite(s[0]) || !isfinite(s[1]))
            return false;

        pt.x = project_axis((s[0] - vp.x) / vp.width, ctx.output_width(), ctx.sizing());
        pt.y = project_axis((s[1] - vp.y) / vp.height, ctx.output_height(), ctx.sizing());
        return true;
    };

    LineEndpoints res;
    if (!project(p1, res.start) || !project(p2, res.end))
        return false;

    out = res;
    return true;
}

/* Shrink a text box by its CSS padding and margin. Percent-positioned axes keep their position and only lose
 * width/height. Falls back to the unmodified box rather than produce a degenerate one. */
SlideMetrics slidify::inset_for_text(const SlideMetrics &metrics, const StyleSnapshot &style) {
    auto side = [](const string &padding, const string &margin) {
        return round_units(parse_css_number(padding, 0.0) * emu_per_px)
            + round_units(parse_css_number(margin, 0.0) * emu_per_px);
    };

    int64_t top = side(style.padding_top, style.margin_top);
    int64_t right = side(style.padding_right, style.margin_right);
    int64_t bottom = side(style.padding_bottom, style.margin_bottom);
    int64_t left = side(style.padding_left, style.margin_left);

    SlideMetrics out(metrics);
    out.w = metrics.w - left - right;
    out.h = metrics.h - top - bottom;
    if (out.w <= 0 || out.h <= 0)
        return metrics;

    if (!metrics.x.is_percent())
        out.x = Coordinate(metrics.x.absolute() + left);
    if (!metrics.y.is_percent())
        out.y = Coordinate(metrics.y.absolute() + top);

    return out;
}

/* Corner radius as a fraction of the shape's shorter side, which is what OOXML's roundRect "adj" guide wants. */
double slidify::resolve_radius(double radius_px, double reference_dimension) {
    if (!isfinite(radius_px) || radius_px <= 0.0)
        return 0.0;

    if (!isfinite(reference_dimension) || reference_dimension <= 0.0)
        reference_dimension = radius_reference_scale;

    return std::min(max_radius_ratio, radius_px / (reference_dimension / 2.0));
}

/* Position a box of width box_w against metrics so that it lines up the way the text alignment says. */
Coordinate slidify::align_x(const SlideMetrics &metrics, int64_t box_w, TextAlign align) {
    if (metrics.x.is_percent())
        return metrics.x;

    switch (align) {
        case ALIGN_CENTER:
            return Coordinate(round_units(metrics.x.absolute() + metrics.w / 2.0 - box_w / 2.0));
        case ALIGN_RIGHT:
            return Coordinate(metrics.x.absolute() + metrics.w - box_w);
        default:
            return metrics.x;
    }
}
