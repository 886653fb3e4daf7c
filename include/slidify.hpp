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

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "geom2d.hpp"

namespace slidify {

    constexpr char lib_version[] = "1.0";

    /* Unit system. Everything we hand to a sink is in EMU (English Metric Units), the absolute length unit of
     * OOXML presentations. */
    constexpr double px_per_in = 96.0;
    constexpr double pt_per_in = 72.0;
    constexpr double emu_per_in = 914400.0;
    constexpr double emu_per_px = emu_per_in / px_per_in;
    constexpr double emu_per_pt = emu_per_in / pt_per_in;

    /* Strokes at or below this width in EMU show up as antialiasing noise in slide viewers instead of as a line. */
    constexpr double stroke_limit_emu = 0.013683353027016402;
    /* OOXML ST_LineWidth upper bound */
    constexpr double max_line_weight_emu = 20116800.0;
    /* round_units saturates here (2^53) */
    constexpr double max_units = 9007199254740992.0;

    /* Corner radii are normalized against this fixed reference, not against the shape's own size. */
    constexpr double radius_reference_scale = 1.0;
    constexpr double max_radius_ratio = 0.05;

    enum SizingMode {
        SIZING_FIT,
        SIZING_VIEWPORT_PERCENT,
    };

    enum CoordinateSpace {
        SPACE_LOCAL,  /* logical (viewBox) units */
        SPACE_SCREEN, /* on-screen pixels, relative to the same origin as the viewport rect */
    };

    class Rect {
    public:
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    class LogicalBox {
    public:
        double min_x = 0.0;
        double min_y = 0.0;
        double width = 0.0;
        double height = 0.0;
    };

    /* Per-slide geometry context. Immutable once constructed. */
    class SlideContext {
    public:
        /* Without a declared logical box, a box of the viewport's size anchored at 0,0 is used. */
        SlideContext(const Rect &viewport, SizingMode mode, double output_width, double output_height);
        SlideContext(const Rect &viewport, const LogicalBox &logical, SizingMode mode, double output_width, double output_height);

        const Rect &viewport() const { return m_viewport; }
        const LogicalBox &logical_box() const { return m_logical; }
        SizingMode sizing() const { return m_sizing; }
        double output_width() const { return m_output_width; }
        double output_height() const { return m_output_height; }

    private:
        Rect m_viewport;
        LogicalBox m_logical;
        SizingMode m_sizing;
        double m_output_width;
        double m_output_height;
    };

    class ElementRect {
    public:
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;
        double height = 0.0;
        CoordinateSpace space = SPACE_SCREEN;
    };

    /* One axis of a slide position. Either an absolute EMU value, or, for content outside the nominal page in
     * viewport-percent sizing, a percentage of the page. Percent coordinates report an absolute value of 0. */
    class Coordinate {
    public:
        Coordinate() : Coordinate(0) {}
        Coordinate(int64_t absolute) : m_percent(false), m_absolute(absolute), m_percent_value(0.0) {}

        static Coordinate percent(double percent_value) {
            Coordinate c(0);
            c.m_percent = true;
            c.m_percent_value = percent_value;
            return c;
        }

        bool is_percent() const { return m_percent; }
        int64_t absolute() const { return m_absolute; }
        double percent_value() const { return m_percent_value; }
        /* "914400" or "-12.5%" */
        std::string str(int precision=6) const;

        bool operator==(const Coordinate &other) const {
            return m_percent == other.m_percent && m_absolute == other.m_absolute
                && m_percent_value == other.m_percent_value;
        }
        bool operator!=(const Coordinate &other) const { return !(*this == other); }

    private:
        bool m_percent;
        int64_t m_absolute;
        double m_percent_value;
    };

    class SlideMetrics {
    public:
        Coordinate x;
        Coordinate y;
        int64_t w = 0;
        int64_t h = 0;

        /* Zero-area boxes must not be emitted */
        bool empty() const { return w <= 0 || h <= 0; }
    };

    class SlidePoint {
    public:
        Coordinate x;
        Coordinate y;
    };

    class LineEndpoints {
    public:
        SlidePoint start;
        SlidePoint end;
    };

    /* Raw computed style of one element, one field per CSS longhand we look at. Values are CSS strings exactly
     * as the style source reports them; parsing happens in the resolvers. */
    class StyleSnapshot {
    public:
        std::string tag;
        std::string id;
        std::string name;
        std::string class_name;

        std::string display;
        std::string visibility;
        std::string opacity;
        /* Product of all ancestors' opacity, element's own opacity excluded */
        double ancestor_opacity = 1.0;

        std::string background_color;
        std::string color;
        std::string fill;
        std::string stroke;
        std::string fill_opacity;
        std::string stroke_opacity;
        std::string border_color;
        std::string border_width;
        std::string stroke_width;
        std::string stroke_dasharray;

        std::string font_family;
        std::string font_size;
        std::string font_weight;
        std::string font_style;
        std::string text_decoration;
        std::string text_align;
        std::string text_anchor;

        std::string border_radius;
        std::string rx;
        std::string ry;

        std::string padding_top;
        std::string padding_right;
        std::string padding_bottom;
        std::string padding_left;
        std::string margin_top;
        std::string margin_right;
        std::string margin_bottom;
        std::string margin_left;
    };

    class RGBA {
    public:
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
        uint8_t a = 0;
    };

    /* Resolves arbitrary CSS color syntax to absolute 8-bit RGBA. */
    class ColorSampler {
    public:
        virtual ~ColorSampler() {}
        virtual RGBA sample(const std::string &css_color) const = 0;
    };

    class CairoColorSampler_D;
    /* Samples colors the way a browser canvas does: paint one pixel, read it back. The 1x1 surface is created on
     * first use and reused afterwards. */
    class CairoColorSampler : public ColorSampler {
    public:
        CairoColorSampler();
        virtual ~CairoColorSampler();
        CairoColorSampler(const CairoColorSampler &) = delete;
        CairoColorSampler &operator=(const CairoColorSampler &) = delete;

        virtual RGBA sample(const std::string &css_color) const;

    private:
        CairoColorSampler_D *d;
    };

    class ColorDescriptor {
    public:
        std::string hex = "#000000";
        double alpha = 0.0;

        bool visible() const { return alpha > 0.0; }
    };

    class ResolvedColors {
    public:
        ColorDescriptor fill;
        ColorDescriptor stroke;
        ColorDescriptor text;
        ColorDescriptor background;
    };

    class FontDescriptor {
    public:
        std::string family;
        double size_pt = 0.0;
        bool bold = false;
        bool italic = false;
        bool underline = false;
        bool strike = false;
    };

    enum DashType {
        DASH_SOLID,
        DASH_DASHED,
    };

    class LineStyle {
    public:
        ColorDescriptor color;
        int64_t weight_emu = 0;
        DashType dash = DASH_SOLID;
    };

    enum TextAlign {
        ALIGN_LEFT,
        ALIGN_CENTER,
        ALIGN_RIGHT,
    };

    class Alignment {
    public:
        TextAlign align = ALIGN_CENTER;
        bool auto_fit = false;
    };

    /* Geometry resolver */
    int64_t round_units(double value);
    SlideMetrics resolve_metrics(const ElementRect &rect, const SlideContext &ctx);
    bool transformed_bounds(const Rect &local, const xform2d &screen_ctm, ElementRect &out);
    bool resolve_line_points(const d2p &p1, const d2p &p2, const xform2d &screen_ctm, const SlideContext &ctx, LineEndpoints &out);
    SlideMetrics inset_for_text(const SlideMetrics &metrics, const StyleSnapshot &style);
    double resolve_radius(double radius_px, double reference_dimension=radius_reference_scale);
    Coordinate align_x(const SlideMetrics &metrics, int64_t box_w, TextAlign align);

    /* Style resolver */
    bool is_vector_tag(const std::string &tag);
    ColorDescriptor color_descriptor(const RGBA &sample, double opacity=1.0);
    ResolvedColors resolve_colors(const StyleSnapshot &style, const ColorSampler &sampler);
    double resolve_stroke_width_units(const StyleSnapshot &style);
    bool resolve_line_style(const StyleSnapshot &style, const ResolvedColors &colors, LineStyle &out);
    FontDescriptor resolve_font(const StyleSnapshot &style);
    DashType resolve_dash(const StyleSnapshot &style);
    Alignment resolve_alignment(const StyleSnapshot &style);
    double resolve_corner_radius_px(const StyleSnapshot &style);

    enum ShapeKind {
        SHAPE_RECT,
        SHAPE_ROUND_RECT,
        SHAPE_ELLIPSE,
    };

    class ShapePrimitive {
    public:
        std::string id;
        ShapeKind kind = SHAPE_RECT;
        SlideMetrics metrics;
        ColorDescriptor fill;
        bool has_line = false;
        LineStyle line;
        double radius_ratio = 0.0;
    };

    class TextPrimitive {
    public:
        std::string id;
        std::string text;
        SlideMetrics metrics;
        FontDescriptor font;
        ColorDescriptor color;
        Alignment alignment;
    };

    class LinePrimitive {
    public:
        std::string id;
        LineEndpoints points;
        LineStyle line;
    };

    /* Templated content (date stamps, page numbers, logos). The sink decides what to fill in. */
    class PlaceholderToken {
    public:
        std::string name;
        SlideMetrics metrics;
        FontDescriptor font;
        ColorDescriptor color;
        Alignment alignment;
    };

    /* Output page layout, shared by every slide of a deck */
    class RenderSettings {
    public:
        double slide_width_in = 20.0;
        double slide_height_in = 11.25;
        SizingMode sizing = SIZING_FIT;
    };

    /* Call order: header, then begin_slide/primitives/end_slide once per slide, then footer. */
    class ShapeSink {
        public:
            virtual ~ShapeSink() {}
            virtual void header(const RenderSettings &rset, size_t slide_count) { (void) rset; (void) slide_count; }
            virtual void begin_slide(const SlideContext &ctx, size_t index) { (void) ctx; (void) index; }
            virtual void end_slide() {}
            virtual ShapeSink &operator<<(const ShapePrimitive &shape) = 0;
            virtual ShapeSink &operator<<(const TextPrimitive &text) = 0;
            virtual ShapeSink &operator<<(const LinePrimitive &line) = 0;
            virtual ShapeSink &operator<<(const PlaceholderToken &tok) {
                cerr << "Warning: placeholder \"" << tok.name << "\" is not supported by this output, ignoring." << endl;
                return *this;
            };
            virtual void footer() {}
    };

    class StreamShapeSink : public ShapeSink {
    public:
        StreamShapeSink(std::ostream &out, bool only_shapes=false) : m_only_shapes(only_shapes), m_out(out) {}
        virtual ~StreamShapeSink() {}
        virtual void header(const RenderSettings &rset, size_t slide_count) { if (!m_only_shapes) header_impl(rset, slide_count); }
        virtual void begin_slide(const SlideContext &ctx, size_t index) { if (!m_only_shapes) begin_slide_impl(ctx, index); }
        virtual void end_slide() { if (!m_only_shapes) end_slide_impl(); }
        virtual void footer() { if (!m_only_shapes) { footer_impl(); } m_out.flush(); }

    protected:
        virtual void header_impl(const RenderSettings &rset, size_t slide_count) = 0;
        virtual void begin_slide_impl(const SlideContext &ctx, size_t index) { (void) ctx; (void) index; }
        virtual void end_slide_impl() {}
        virtual void footer_impl() = 0;

        bool m_only_shapes = false;
        std::ostream &m_out;
    };

    class SlidePrimitives {
    public:
        std::vector<ShapePrimitive> shapes;
        std::vector<TextPrimitive> texts;
        std::vector<LinePrimitive> lines;
        std::vector<PlaceholderToken> placeholders;
    };

    /* One SlidePrimitives entry per slide */
    class ListShapeSink : public ShapeSink {
    public:
        ListShapeSink(std::vector<SlidePrimitives> &out) : m_out(out) {}

        virtual void begin_slide(const SlideContext &ctx, size_t index);
        virtual ListShapeSink &operator<<(const ShapePrimitive &shape);
        virtual ListShapeSink &operator<<(const TextPrimitive &text);
        virtual ListShapeSink &operator<<(const LinePrimitive &line);
        virtual ListShapeSink &operator<<(const PlaceholderToken &tok);

    private:
        SlidePrimitives &current();

        std::vector<SlidePrimitives> &m_out;
    };

    /* S-expression listing of the resolved primitives, one per line */
    class SexpSlideOutput : public StreamShapeSink {
    public:
        SexpSlideOutput(std::ostream &out, bool only_shapes=false, int digits_frac=6);
        virtual ~SexpSlideOutput() {}
        virtual SexpSlideOutput &operator<<(const ShapePrimitive &shape);
        virtual SexpSlideOutput &operator<<(const TextPrimitive &text);
        virtual SexpSlideOutput &operator<<(const LinePrimitive &line);
        virtual SexpSlideOutput &operator<<(const PlaceholderToken &tok);
        virtual void header_impl(const RenderSettings &rset, size_t slide_count);
        virtual void begin_slide_impl(const SlideContext &ctx, size_t index);
        virtual void end_slide_impl();
        virtual void footer_impl();

    private:
        const char *indent() const;

        int m_digits_frac;
        bool m_in_slide = false;
    };

    /* Preview SVG in EMU user units */
    class SimpleSVGOutput : public StreamShapeSink {
    public:
        SimpleSVGOutput(std::ostream &out, bool only_shapes=false, int digits_frac=6);
        virtual ~SimpleSVGOutput() {}
        virtual SimpleSVGOutput &operator<<(const ShapePrimitive &shape);
        virtual SimpleSVGOutput &operator<<(const TextPrimitive &text);
        virtual SimpleSVGOutput &operator<<(const LinePrimitive &line);
        virtual SimpleSVGOutput &operator<<(const PlaceholderToken &tok);
        virtual void header_impl(const RenderSettings &rset, size_t slide_count);
        virtual void begin_slide_impl(const SlideContext &ctx, size_t index);
        virtual void end_slide_impl();
        virtual void footer_impl();

    private:
        int m_digits_frac;
        int64_t m_page_h = 0;
        int64_t m_page_gap = 0;
    };

    /* Decides which elements take part in the export. Rejected elements are skipped along with their subtree. */
    class ElementSelector {
    public:
        virtual ~ElementSelector() {}
        virtual bool match(const pugi::xml_node &node, const StyleSnapshot &style) const;

        bool presentation_mode = false;
        std::vector<std::string> exclude_classes;
    };

    class TextMeasurer;
    class RenderContext {
        public:
            RenderContext(const RenderSettings &settings,
                    ShapeSink &sink,
                    const ElementSelector &sel,
                    const SlideContext &slide,
                    const ColorSampler &sampler,
                    TextMeasurer &measurer,
                    xform2d viewport_mat);
            RenderContext(RenderContext &parent,
                    xform2d transform);

            ShapeSink &sink() { return m_sink; }
            const ElementSelector &sel() { return m_sel; }
            const RenderSettings &settings() { return m_settings; }
            const SlideContext &slide() { return m_slide; }
            const ColorSampler &sampler() { return m_sampler; }
            TextMeasurer &measurer() { return m_measurer; }
            xform2d &mat() { return m_mat; }
            bool match(const pugi::xml_node &node, const StyleSnapshot &style) {
                return m_sel.match(node, style);
            }

        private:
            ShapeSink &m_sink;
            const RenderSettings &m_settings;
            const ElementSelector &m_sel;
            const SlideContext &m_slide;
            const ColorSampler &m_sampler;
            TextMeasurer &m_measurer;
            xform2d m_mat;
    };

    class SlideDocument {
        public:
            SlideDocument() : _valid(false) {}

            /* true -> load successful */
            bool load(std::istream &in);
            bool load(std::string filename);
            bool valid() const { return _valid; }
            operator bool() const { return valid(); }

            /* on-screen size in px */
            double width() const { return page_w; }
            double height() const { return page_h; }
            const Rect &viewport() const { return m_viewport; }
            const LogicalBox &logical_box() const { return m_logical; }

            SlideContext slide_context(const RenderSettings &rset) const;
            /* Stand-alone single slide output, including the sink's header and footer */
            void render(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel=ElementSelector());
            void render_to_list(const RenderSettings &rset, const ColorSampler &sampler, SlidePrimitives &out, const ElementSelector &sel=ElementSelector());
            /* Emit this document as slide number index of a larger output, bracketed by begin_slide/end_slide */
            void render_slide(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel, size_t index);

        private:
            void export_svg_group(RenderContext &ctx, const pugi::xml_node &group, const StyleSnapshot &group_style);
            void export_svg_rect(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style);
            void export_svg_ellipse(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style);
            void export_svg_line(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style);
            void export_svg_text(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style);
            void export_placeholder(RenderContext &ctx, const pugi::xml_node &group, const StyleSnapshot &style);
            bool screen_bounds(RenderContext &ctx, const pugi::xml_node &node, const StyleSnapshot &style, ElementRect &out);
            xform2d viewport_xform() const;

            bool _valid;
            pugi::xml_document svg_doc;
            pugi::xml_node root_elem;
            double page_w, page_h;
            Rect m_viewport;
            LogicalBox m_logical;
    };

    /* Ordered list of slide documents sharing one output page layout. Each slide keeps its own viewport and
     * viewBox and so its own SlideContext. */
    class SlideDeck {
        public:
            /* true -> slide loaded and appended */
            bool add(std::istream &in);
            bool add(std::string filename);

            size_t size() const { return m_slides.size(); }
            bool empty() const { return m_slides.empty(); }
            SlideDocument &operator[](size_t index) { return *m_slides[index]; }

            void render(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel=ElementSelector());
            void render_to_list(const RenderSettings &rset, const ColorSampler &sampler, std::vector<SlidePrimitives> &out, const ElementSelector &sel=ElementSelector());

        private:
            std::vector<std::unique_ptr<SlideDocument>> m_slides;
    };
}
