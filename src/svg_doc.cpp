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

#include <iostream>
#include <fstream>
#include <cmath>
#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

#include <slidify.hpp>
#include "svg_import_util.h"
#include "svg_style.h"
#include "svg_text.h"

using namespace slidify;
using namespace std;

namespace {

/* Size assumed for documents that give neither width/height nor a viewBox */
constexpr double fallback_page_w = 1920.0;
constexpr double fallback_page_h = 1080.0;

bool is_placeholder_name(const string &name) {
    return name == "@updateDate" || name == "@pageNumber" || name == "@Logo" || name == "@Svg";
}

bool is_ignored_tag(const string &name) {
    return name == "defs" || name == "title" || name == "desc" || name == "metadata" || name == "style";
}

/* Untransformed bounding box of a single graphic element in its own user units */
bool local_bounds(const pugi::xml_node &node, const StyleSnapshot &style, TextMeasurer &measurer, Rect &out) {
    string name(node.name());

    if (name == "rect") {
        out.x = svg_double_attr(node, "x", 0.0);
        out.y = svg_double_attr(node, "y", 0.0);
        out.width = svg_double_attr(node, "width", 0.0);
        out.height = svg_double_attr(node, "height", 0.0);
        return true;

    } else if (name == "circle") {
        double cx = svg_double_attr(node, "cx", 0.0);
        double cy = svg_double_attr(node, "cy", 0.0);
        double r = svg_double_attr(node, "r", 0.0);
        out = Rect { cx - r, cy - r, 2*r, 2*r };
        return true;

    } else if (name == "ellipse") {
        double cx = svg_double_attr(node, "cx", 0.0);
        double cy = svg_double_attr(node, "cy", 0.0);
        double rx = parse_svg_length(style.rx, 0.0);
        double ry = parse_svg_length(style.ry, 0.0);
        out = Rect { cx - rx, cy - ry, 2*rx, 2*ry };
        return true;

    } else if (name == "line") {
        double x1 = svg_double_attr(node, "x1", 0.0);
        double y1 = svg_double_attr(node, "y1", 0.0);
        double x2 = svg_double_attr(node, "x2", 0.0);
        double y2 = svg_double_attr(node, "y2", 0.0);
        out = Rect { fmin(x1, x2), fmin(y1, y2), fabs(x2 - x1), fabs(y2 - y1) };
        return true;

    } else if (name == "text") {
        return text_local_bounds(node, style, measurer, out);
    }

    return false;
}

void union_bounds(ElementRect &acc, bool &have, const ElementRect &r) {
    if (!have) {
        acc = r;
        have = true;
        return;
    }

    double max_x = fmax(acc.x + acc.width, r.x + r.width);
    double max_y = fmax(acc.y + acc.height, r.y + r.height);
    acc.x = fmin(acc.x, r.x);
    acc.y = fmin(acc.y, r.y);
    acc.width = max_x - acc.x;
    acc.height = max_y - acc.y;
}

} /* anonymous namespace */

bool slidify::SlideDocument::load(string filename) {
    ifstream in_f;
    in_f.open(filename);

    return in_f && load(in_f);
}

bool slidify::SlideDocument::load(istream &in) {
    _valid = false;

    /* Load XML document */
    auto res = svg_doc.load(in);
    if (!res) {
        cerr << "Error: Cannot parse input file: " << res.description() << endl;
        return false;
    }

    root_elem = svg_doc.child("svg");
    if (!root_elem) {
        cerr << "Error: Input file is missing root <svg> element" << endl;
        return false;
    }

    page_w = svg_double_attr(root_elem, "width", std::nan(""));
    page_h = svg_double_attr(root_elem, "height", std::nan(""));
    if (!(page_w > 0.0))
        page_w = std::nan("");
    if (!(page_h > 0.0))
        page_h = std::nan("");

    /* Logical coordinate system */
    double vb_x, vb_y, vb_w, vb_h;
    bool have_vb = parse_view_box(root_elem.attribute("viewBox").value(), vb_x, vb_y, vb_w, vb_h)
        && vb_w > 0.0 && vb_h > 0.0;

    if (!have_vb) {
        if (root_elem.attribute("viewBox")) { /* A document with just width/height and no viewBox is okay. */
            cerr << "Warning: Invalid viewBox, defaulting to width/height values" << endl;
        }

        if (isnan(page_w) || isnan(page_h)) {
            cerr << "Warning: Neither width/height nor viewBox given on <svg> root element. Assuming "
                << fallback_page_w << " x " << fallback_page_h << " px." << endl;
            page_w = fallback_page_w;
            page_h = fallback_page_h;
        }

        vb_x = vb_y = 0;
        vb_w = page_w;
        vb_h = page_h;

    } else if (isnan(page_w) || isnan(page_h)) {
        cerr << "No slide width or height given, defaulting to viewBox values." << endl;
        page_w = vb_w;
        page_h = vb_h;
    }

    m_viewport = Rect { 0.0, 0.0, page_w, page_h };
    m_logical = LogicalBox { vb_x, vb_y, vb_w, vb_h };

    if (fabs((vb_w / page_w) / (vb_h / page_h) - 1.0) > 0.001) {
        cerr << "Warning: Document has different unit scale in x and y direction, content will be stretched." << endl;
    }

    cerr << "Resulting slide viewport " << page_w << " px x " << page_h << " px" << endl;
    cerr << "Resulting document scale " << fabs(vb_w/page_w) << " x " << fabs(vb_h/page_h) << endl;

    _valid = true;
    return true;
}

SlideContext slidify::SlideDocument::slide_context(const RenderSettings &rset) const {
    return SlideContext(m_viewport, m_logical, rset.sizing,
            rset.slide_width_in * emu_per_in, rset.slide_height_in * emu_per_in);
}

/* viewBox stretched onto the viewport */
xform2d slidify::SlideDocument::viewport_xform() const {
    xform2d xf;
    xf.scale(m_viewport.width / m_logical.width, m_viewport.height / m_logical.height);
    xf.translate(-m_logical.min_x, -m_logical.min_y);
    return xf;
}

bool slidify::ElementSelector::match(const pugi::xml_node &node, const StyleSnapshot &style) const {
    (void) node;

    if (to_lower(trim(style.display)) == "none")
        return false;

    string visibility = to_lower(trim(style.visibility));
    if (visibility == "hidden" || visibility == "collapse")
        return false;

    if (parse_opacity_factor(style.opacity) * style.ancestor_opacity <= 0.0)
        return false;

    const string &cls = style.class_name;
    if (cls.find("no-export") != string::npos)
        return false;

    if (cls.find("hide-on-export") != string::npos)
        return false;

    if (presentation_mode && cls.find("hide-on-presentation") != string::npos)
        return false;

    for (const auto &excl : exclude_classes) {
        if (!excl.empty() && cls.find(excl) != string::npos)
            return false;
    }

    return true;
}

/* Recursively export all SVG elements in the given group. */
void slidify::SlideDocument::export_svg_group(RenderContext &ctx, const pugi::xml_node &group, const StyleSnapshot &group_style) {
    for (const auto &node : group.children()) {
        if (node.type() != pugi::node_element)
            continue;

        string name(node.name());
        if (is_ignored_tag(name))
            continue;

        StyleSnapshot style = collect_style(node, &group_style);
        if (!ctx.match(node, style))
            continue;

        RenderContext elem_ctx(ctx, xform2d(node.attribute("transform").value()));

        if (name == "g") {
            if (is_placeholder_name(style.name)) {
                export_placeholder(elem_ctx, node, style);
            } else {
                export_svg_group(elem_ctx, node, style);
            }

        } else if (name == "rect") {
            export_svg_rect(elem_ctx, node, style);

        } else if (name == "circle" || name == "ellipse") {
            export_svg_ellipse(elem_ctx, node, style);

        } else if (name == "line") {
            export_svg_line(elem_ctx, node, style);

        } else if (name == "text") {
            export_svg_text(elem_ctx, node, style);

        } else {
            cerr << "Warning: Ignoring unexpected child: <" << node.name() << ">" << endl;
        }
    }
}

/* Union of the screen bounds of an element and, for groups, everything below it. */
bool slidify::SlideDocument::screen_bounds(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style, ElementRect &out) {
    if (string(node.name()) != "g") {
        Rect local;
        if (!local_bounds(node, style, ctx.measurer(), local))
            return false;

        return transformed_bounds(local, ctx.mat(), out);
    }

    bool have = false;
    for (const auto &child : node.children()) {
        if (child.type() != pugi::node_element || is_ignored_tag(child.name()))
            continue;

        StyleSnapshot child_style = collect_style(child, &style);
        if (!ctx.match(child, child_style))
            continue;

        RenderContext child_ctx(ctx, xform2d(child.attribute("transform").value()));
        ElementRect r;
        if (screen_bounds(child_ctx, child, child_style, r))
            union_bounds(out, have, r);
    }
    return have;
}

void slidify::SlideDocument::export_placeholder(RenderContext &ctx, const pugi::xml_node &group, const StyleSnapshot &style) {
    ElementRect bounds;
    if (!screen_bounds(ctx, group, style, bounds)) {
        cerr << "Warning: Placeholder \"" << style.name << "\" has no content to take its size from, ignoring." << endl;
        return;
    }

    ResolvedColors colors = resolve_colors(style, ctx.sampler());

    PlaceholderToken tok;
    tok.name = style.name;
    tok.metrics = resolve_metrics(bounds, ctx.slide());
    tok.font = resolve_font(style);
    tok.color = colors.fill;
    tok.alignment = resolve_alignment(style);

    if (tok.name == "@updateDate") {
        /* Rendered dates run wider than whatever sample text the template carries */
        int64_t box_w = tok.metrics.w * 2;
        tok.metrics.x = align_x(tok.metrics, box_w, tok.alignment.align);
        tok.metrics.w = box_w;
    }

    ctx.sink() << tok;
}

namespace {

bool shape_metrics(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style, SlideMetrics &out) {
    Rect local;
    if (!local_bounds(node, style, ctx.measurer(), local))
        return false;

    ElementRect er;
    if (!transformed_bounds(local, ctx.mat(), er)) {
        cerr << "Warning: Non-finite transform on <" << node.name() << "> \"" << node.attribute("id").value() << "\", ignoring." << endl;
        return false;
    }

    out = resolve_metrics(er, ctx.slide());
    return !out.empty();
}

void export_shape(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style, ShapeKind kind) {
    ShapePrimitive shape;
    if (!shape_metrics(ctx, node, style, shape.metrics))
        return;

    ResolvedColors colors = resolve_colors(style, ctx.sampler());
    shape.id = style.id;
    shape.kind = kind;
    shape.fill = colors.fill;
    shape.has_line = resolve_line_style(style, colors, shape.line);

    /* Nothing to draw */
    if (!shape.fill.visible() && !shape.has_line)
        return;

    if (kind == SHAPE_RECT) {
        shape.radius_ratio = resolve_radius(resolve_corner_radius_px(style));
        if (shape.radius_ratio > 0.0)
            shape.kind = SHAPE_ROUND_RECT;
    }

    ctx.sink() << shape;
}

} /* anonymous namespace */

void slidify::SlideDocument::export_svg_rect(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style) {
    export_shape(ctx, node, style, SHAPE_RECT);
}

void slidify::SlideDocument::export_svg_ellipse(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style) {
    export_shape(ctx, node, style, SHAPE_ELLIPSE);
}

void slidify::SlideDocument::export_svg_line(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style) {
    d2p p1 { svg_double_attr(node, "x1", 0.0), svg_double_attr(node, "y1", 0.0) };
    d2p p2 { svg_double_attr(node, "x2", 0.0), svg_double_attr(node, "y2", 0.0) };

    LinePrimitive line;
    line.id = style.id;
    if (!resolve_line_points(p1, p2, ctx.mat(), ctx.slide(), line.points)) {
        cerr << "Warning: Line \"" << style.id << "\" has non-finite endpoints, ignoring." << endl;
        return;
    }

    ResolvedColors colors = resolve_colors(style, ctx.sampler());
    if (!resolve_line_style(style, colors, line.line))
        return;

    ctx.sink() << line;
}

void slidify::SlideDocument::export_svg_text(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style) {
    TextPrimitive text;
    text.text = text_content(node);
    if (text.text.empty())
        return;

    SlideMetrics metrics;
    if (!shape_metrics(ctx, node, style, metrics))
        return;

    ResolvedColors colors = resolve_colors(style, ctx.sampler());
    text.id = style.id;
    text.metrics = inset_for_text(metrics, style);
    text.font = resolve_font(style);
    text.color = colors.fill;
    text.alignment = resolve_alignment(style);

    ctx.sink() << text;
}

void slidify::SlideDocument::render_slide(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel, size_t index) {
    if (!_valid) {
        cerr << "Error: Cannot render, no document loaded" << endl;
        return;
    }

    /* Primitives are handed to the sink as we encounter them, in document order. */
    SlideContext slide = slide_context(rset);
    TextMeasurer measurer;
    RenderContext ctx(rset, sink, sel, slide, sampler, measurer, viewport_xform());

    sink.begin_slide(slide, index);
    StyleSnapshot root_style = collect_style(root_elem, nullptr);
    if (ctx.match(root_elem, root_style)) {
        RenderContext root_ctx(ctx, xform2d(root_elem.attribute("transform").value()));
        export_svg_group(root_ctx, root_elem, root_style);
    }
    sink.end_slide();
}

void slidify::SlideDocument::render(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel) {
    if (!_valid) {
        cerr << "Error: Cannot render, no document loaded" << endl;
        return;
    }

    sink.header(rset, 1);
    render_slide(rset, sampler, sink, sel, 0);
    sink.footer();
}

void slidify::SlideDocument::render_to_list(const RenderSettings &rset, const ColorSampler &sampler, SlidePrimitives &out, const ElementSelector &sel) {
    vector<SlidePrimitives> slides;
    ListShapeSink sink(slides);
    render(rset, sampler, sink, sel);
    out = slides.empty() ? SlidePrimitives() : std::move(slides.front());
}

slidify::RenderContext::RenderContext(const RenderSettings &settings,
        ShapeSink &sink,
        const ElementSelector &sel,
        const SlideContext &slide,
        const ColorSampler &sampler,
        TextMeasurer &measurer,
        xform2d viewport_mat) :
    m_sink(sink),
    m_settings(settings),
    m_sel(sel),
    m_slide(slide),
    m_sampler(sampler),
    m_measurer(measurer),
    m_mat(viewport_mat)
{
}

slidify::RenderContext::RenderContext(RenderContext &parent, xform2d transform) :
    m_sink(parent.sink()),
    m_settings(parent.settings()),
    m_sel(parent.sel()),
    m_slide(parent.slide()),
    m_sampler(parent.sampler()),
    m_measurer(parent.measurer()),
    m_mat(parent.mat())
{
    m_mat.transform(transform);
}
