#include <iostream>
#include <cmath>
#include <limits>
#include <numbers>

#include <slidify.hpp>

#include <minunit.h>

using namespace slidify;

/* 10in x 6in slide for a 1000 x 600 px page, i.e. 9144 EMU per px */
static SlideContext test_slide(SizingMode mode=SIZING_FIT) {
    return SlideContext(Rect { 0, 0, 1000, 600 }, LogicalBox { 0, 0, 1000, 600 }, mode, 9144000, 5486400);
}

MU_TEST(test_round_units) {
    mu_assert_int_eq(1, (int)round_units(0.5));
    mu_assert_int_eq(3, (int)round_units(2.5));
    mu_assert_int_eq(1, (int)round_units(0.49999999999999994));
    mu_assert_int_eq(0, (int)round_units(0.4));
    mu_assert_int_eq(-2, (int)round_units(-2.4));
    mu_assert_int_eq(0, (int)round_units(std::nan("")));
    mu_assert_int_eq(0, (int)round_units(std::numeric_limits<double>::infinity()));
}

MU_TEST(test_round_units_saturates) {
    mu_assert(round_units(1e300) == (int64_t)max_units, "huge value must saturate");
    mu_assert(round_units(-1e300) == -(int64_t)max_units, "huge negative value must saturate");
    mu_assert(round_units(1e19) == (int64_t)max_units, "value past int64_t must saturate");
    mu_assert(round_units(123456789012.0) == 123456789012LL, "large in-range value must be exact");
}

MU_TEST(test_huge_element) {
    SlideContext ctx = test_slide();
    SlideMetrics m = resolve_metrics(ElementRect { 0, 0, 1e300, 10, SPACE_SCREEN }, ctx);
    mu_assert_int_eq(0, (int)m.x.absolute());
    mu_assert(m.w == (int64_t)max_units, "huge width must saturate");
    mu_assert_int_eq(91440, (int)m.h);

    m = resolve_metrics(ElementRect { -1e300, 1e300, 10, 10, SPACE_SCREEN }, ctx);
    mu_assert(m.x.absolute() == -(int64_t)max_units, "huge negative x must saturate");
    mu_assert(m.y.absolute() == (int64_t)max_units, "huge y must saturate");

    m = resolve_metrics(ElementRect { -1e300, 0, 10, 10, SPACE_SCREEN }, test_slide(SIZING_VIEWPORT_PERCENT));
    mu_assert(m.x.is_percent(), "off-page x must be a percentage");
    mu_assert(std::isfinite(m.x.percent_value()), "percentage must stay finite");
}

MU_TEST(test_in_box_rects_stay_on_page) {
    /* Every rect fully inside the page must end inside the output extents, in both sizing modes */
    for (SizingMode mode : {SIZING_FIT, SIZING_VIEWPORT_PERCENT}) {
        SlideContext ctx = test_slide(mode);
        for (double x = 0; x <= 1000; x += 37.3) {
            for (double y = 0; y <= 600; y += 29.9) {
                for (double w : {0.0, 0.3, 1.0, 17.7, 250.5}) {
                    double h = w * 0.7;
                    if (x + w > 1000 || y + h > 600)
                        continue;

                    SlideMetrics m = resolve_metrics(ElementRect { x, y, w, h, SPACE_SCREEN }, ctx);
                    mu_assert(!m.x.is_percent() && !m.y.is_percent(), "in-box rect got a percentage");
                    mu_assert(m.x.absolute() >= 0 && m.y.absolute() >= 0, "in-box rect starts off page");
                    mu_assert(m.x.absolute() + m.w <= 9144000 + 1, "in-box rect ends past the right edge");
                    mu_assert(m.y.absolute() + m.h <= 5486400 + 1, "in-box rect ends past the bottom edge");
                }
            }
        }
    }
}

MU_TEST(test_fit_screen_rect) {
    SlideContext ctx = test_slide();
    ElementRect r { 100, 60, 200, 120, SPACE_SCREEN };
    SlideMetrics m = resolve_metrics(r, ctx);

    mu_assert(!m.x.is_percent(), "x must be absolute in fit mode");
    mu_assert(!m.y.is_percent(), "y must be absolute in fit mode");
    mu_assert_int_eq(914400, (int)m.x.absolute());
    mu_assert_int_eq(548640, (int)m.y.absolute());
    mu_assert_int_eq(1828800, (int)m.w);
    mu_assert_int_eq(1097280, (int)m.h);
}

MU_TEST(test_fit_local_rect_with_offset_view_box) {
    SlideContext ctx(Rect { 0, 0, 1000, 600 }, LogicalBox { -500, -300, 1000, 600 }, SIZING_FIT, 9144000, 5486400);
    ElementRect r { -400, -240, 200, 120, SPACE_LOCAL };
    SlideMetrics m = resolve_metrics(r, ctx);

    mu_assert_int_eq(914400, (int)m.x.absolute());
    mu_assert_int_eq(548640, (int)m.y.absolute());
    mu_assert_int_eq(1828800, (int)m.w);
    mu_assert_int_eq(1097280, (int)m.h);
}

MU_TEST(test_screen_rect_scaled_viewport) {
    /* Page shown at half size on screen, starting at 50,50 */
    SlideContext ctx(Rect { 50, 50, 500, 300 }, LogicalBox { 0, 0, 1000, 600 }, SIZING_FIT, 9144000, 5486400);
    ElementRect r { 100, 80, 100, 60, SPACE_SCREEN };
    SlideMetrics m = resolve_metrics(r, ctx);

    mu_assert_int_eq(914400, (int)m.x.absolute());
    mu_assert_int_eq(548640, (int)m.y.absolute());
    mu_assert_int_eq(1828800, (int)m.w);
    mu_assert_int_eq(1097280, (int)m.h);
}

MU_TEST(test_percent_mode_inside_page_matches_fit) {
    ElementRect r { 100, 60, 200, 120, SPACE_SCREEN };
    SlideMetrics fit = resolve_metrics(r, test_slide(SIZING_FIT));
    SlideMetrics pct = resolve_metrics(r, test_slide(SIZING_VIEWPORT_PERCENT));

    mu_assert(fit.x == pct.x, "x differs between fit and percent mode for on-page content");
    mu_assert(fit.y == pct.y, "y differs between fit and percent mode for on-page content");
    mu_assert_int_eq((int)fit.w, (int)pct.w);
    mu_assert_int_eq((int)fit.h, (int)pct.h);
}

MU_TEST(test_percent_mode_off_page) {
    ElementRect r { -100, 660, 200, 120, SPACE_SCREEN };
    SlideMetrics m = resolve_metrics(r, test_slide(SIZING_VIEWPORT_PERCENT));

    mu_assert(m.x.is_percent(), "x left of the page must be a percentage");
    mu_assert(m.y.is_percent(), "y below the page must be a percentage");
    mu_assert_int_eq(0, (int)m.x.absolute());
    mu_assert_int_eq(0, (int)m.y.absolute());
    mu_assert(fabs(m.x.percent_value() - (-10.0)) < 1e-9, "wrong x percentage");
    mu_assert(fabs(m.y.percent_value() - 110.0) < 1e-9, "wrong y percentage");
    mu_assert_string_eq("-10%", m.x.str().c_str());

    /* Extents stay absolute */
    mu_assert_int_eq(1828800, (int)m.w);
    mu_assert_int_eq(1097280, (int)m.h);
}

MU_TEST(test_degenerate_extents) {
    SlideContext ctx = test_slide();

    ElementRect neg { 10, 10, -50, 20, SPACE_SCREEN };
    SlideMetrics m = resolve_metrics(neg, ctx);
    mu_assert_int_eq(0, (int)m.w);
    mu_assert(m.empty(), "negative width must give an empty box");

    ElementRect nan_rect { std::nan(""), 10, std::nan(""), 20, SPACE_SCREEN };
    m = resolve_metrics(nan_rect, ctx);
    mu_assert_int_eq(0, (int)m.x.absolute());
    mu_assert(!m.x.is_percent(), "non-finite x must not turn into a percentage");
    mu_assert_int_eq(0, (int)m.w);
}

MU_TEST(test_degenerate_context) {
    /* Zero-size viewport and logical box must not produce NaN or infinities */
    SlideContext ctx(Rect { 0, 0, 0, 0 }, LogicalBox { 0, 0, 0, 0 }, SIZING_FIT, 9144000, 5486400);
    ElementRect r { 0.5, 0.5, 0.25, 0.25, SPACE_SCREEN };
    SlideMetrics m = resolve_metrics(r, ctx);
    mu_assert_int_eq(4572000, (int)m.x.absolute());
    mu_assert_int_eq(2743200, (int)m.y.absolute());
}

MU_TEST(test_resolve_metrics_deterministic) {
    SlideContext ctx = test_slide(SIZING_VIEWPORT_PERCENT);
    ElementRect r { 333.3, -12.7, 45.6, 78.9, SPACE_SCREEN };
    SlideMetrics a = resolve_metrics(r, ctx);
    SlideMetrics b = resolve_metrics(r, ctx);
    mu_assert(a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h, "same input must give same output");
}

MU_TEST(test_transformed_bounds_translate) {
    ElementRect out;
    xform2d xf;
    xf.translate(10, 20);
    mu_assert(transformed_bounds(Rect { 1, 2, 30, 40 }, xf, out), "translation failed");
    mu_assert_double_eq(11.0, out.x);
    mu_assert_double_eq(22.0, out.y);
    mu_assert_double_eq(30.0, out.width);
    mu_assert_double_eq(40.0, out.height);
    mu_assert_int_eq(SPACE_SCREEN, out.space);
}

MU_TEST(test_transformed_bounds_mirror) {
    ElementRect out;
    xform2d xf;
    xf.scale(-1, 1);
    mu_assert(transformed_bounds(Rect { 10, 20, 30, 40 }, xf, out), "mirror failed");
    mu_assert_double_eq(-40.0, out.x);
    mu_assert_double_eq(20.0, out.y);
    mu_assert_double_eq(30.0, out.width);
    mu_assert_double_eq(40.0, out.height);
}

MU_TEST(test_transformed_bounds_rotation) {
    ElementRect out;
    xform2d xf("rotate(45)");
    mu_assert(transformed_bounds(Rect { 0, 0, 10, 10 }, xf, out), "rotation failed");
    double diag = 10 * std::numbers::sqrt2;
    mu_assert(fabs(out.width - diag) < 1e-9, "rotated width is not the diagonal");
    mu_assert(fabs(out.height - diag) < 1e-9, "rotated height is not the diagonal");
    mu_assert(fabs(out.x + diag / 2) < 1e-9, "rotated box has wrong left edge");
}

MU_TEST(test_transformed_bounds_non_finite) {
    ElementRect out;
    xform2d xf(std::nan(""), 0, 0, 1);
    mu_assert(!transformed_bounds(Rect { 0, 0, 10, 10 }, xf, out), "NaN transform must be rejected");
}

MU_TEST(test_line_points) {
    SlideContext ctx = test_slide();
    LineEndpoints pts;
    xform2d xf;
    xf.translate(100, 0);
    mu_assert(resolve_line_points({0, 0}, {400, 300}, xf, ctx, pts), "line rejected");
    mu_assert_int_eq(914400, (int)pts.start.x.absolute());
    mu_assert_int_eq(0, (int)pts.start.y.absolute());
    mu_assert_int_eq(4572000, (int)pts.end.x.absolute());
    mu_assert_int_eq(2743200, (int)pts.end.y.absolute());
}

MU_TEST(test_line_points_off_page_percent) {
    SlideContext ctx = test_slide(SIZING_VIEWPORT_PERCENT);
    LineEndpoints pts;
    mu_assert(resolve_line_points({-500, 0}, {500, 300}, xform2d(), ctx, pts), "line rejected");
    mu_assert(pts.start.x.is_percent(), "off-page endpoint must be a percentage");
    mu_assert(fabs(pts.start.x.percent_value() + 50.0) < 1e-9, "wrong percentage");
    mu_assert(!pts.end.x.is_percent(), "on-page endpoint must be absolute");
}

MU_TEST(test_line_points_non_finite) {
    SlideContext ctx = test_slide();
    LineEndpoints pts;
    pts.start.x = Coordinate(42);
    mu_assert(!resolve_line_points({std::nan(""), 0}, {1, 1}, xform2d(), ctx, pts), "NaN endpoint accepted");
    mu_assert_int_eq(42, (int)pts.start.x.absolute());
    mu_assert(!resolve_line_points({0, 0}, {1, std::numeric_limits<double>::infinity()}, xform2d(), ctx, pts),
            "infinite endpoint accepted");
}

MU_TEST(test_inset_for_text) {
    SlideMetrics m;
    m.x = Coordinate(100000);
    m.y = Coordinate(200000);
    m.w = 500000;
    m.h = 300000;

    StyleSnapshot style;
    style.padding_left = "2px";
    style.margin_left = "1px";
    style.padding_top = "4px";

    SlideMetrics out = inset_for_text(m, style);
    mu_assert_int_eq(100000 + 3 * 9525, (int)out.x.absolute());
    mu_assert_int_eq(200000 + 4 * 9525, (int)out.y.absolute());
    mu_assert_int_eq(500000 - 3 * 9525, (int)out.w);
    mu_assert_int_eq(300000 - 4 * 9525, (int)out.h);
}

MU_TEST(test_inset_for_text_fallback) {
    SlideMetrics m;
    m.x = Coordinate(100000);
    m.y = Coordinate(200000);
    m.w = 50000;
    m.h = 30000;

    StyleSnapshot style;
    style.padding_left = "10px";
    style.padding_right = "10px";

    SlideMetrics out = inset_for_text(m, style);
    mu_assert(out.x == m.x && out.y == m.y, "position must be unchanged");
    mu_assert_int_eq(50000, (int)out.w);
    mu_assert_int_eq(30000, (int)out.h);
}

MU_TEST(test_inset_for_text_percent) {
    SlideMetrics m;
    m.x = Coordinate::percent(-5.0);
    m.y = Coordinate(0);
    m.w = 500000;
    m.h = 300000;

    StyleSnapshot style;
    style.padding_left = "1px";

    SlideMetrics out = inset_for_text(m, style);
    mu_assert(out.x == m.x, "percent position must be kept");
    mu_assert_int_eq(500000 - 9525, (int)out.w);
}

MU_TEST(test_resolve_radius) {
    mu_assert_double_eq(0.05, resolve_radius(40));
    mu_assert_double_eq(0.02, resolve_radius(0.01));
    mu_assert_double_eq(0.0, resolve_radius(0));
    mu_assert_double_eq(0.0, resolve_radius(-3));
    mu_assert_double_eq(0.0, resolve_radius(std::nan("")));
    mu_assert_double_eq(0.05, resolve_radius(40, 0));
}

MU_TEST(test_align_x) {
    SlideMetrics m;
    m.x = Coordinate(1000);
    m.w = 100;

    mu_assert_int_eq(1000, (int)align_x(m, 200, ALIGN_LEFT).absolute());
    mu_assert_int_eq(950, (int)align_x(m, 200, ALIGN_CENTER).absolute());
    mu_assert_int_eq(900, (int)align_x(m, 200, ALIGN_RIGHT).absolute());

    m.x = Coordinate::percent(120);
    mu_assert(align_x(m, 200, ALIGN_RIGHT) == m.x, "percent x must not be shifted");
}

MU_TEST(test_xform2d_parse) {
    xform2d xf("translate(10,20) scale(2)");
    d2p p = xf.doc2phys({1, 1});
    mu_assert_double_eq(12.0, p[0]);
    mu_assert_double_eq(22.0, p[1]);

    xform2d rot("rotate(90 10 10)");
    p = rot.doc2phys({20, 10});
    mu_assert(fabs(p[0] - 10.0) < 1e-9 && fabs(p[1] - 20.0) < 1e-9, "rotation about center point is wrong");

    xform2d mat("matrix(1 0 0 1 5 -5)");
    p = mat.doc2phys({0, 0});
    mu_assert_double_eq(5.0, p[0]);
    mu_assert_double_eq(-5.0, p[1]);

    xform2d bad("frobnicate(1)");
    p = bad.doc2phys({3, 4});
    mu_assert_double_eq(3.0, p[0]);
    mu_assert_double_eq(4.0, p[1]);
}

MU_TEST_SUITE(slide_geom_suite) {
    MU_RUN_TEST(test_round_units);
    MU_RUN_TEST(test_round_units_saturates);
    MU_RUN_TEST(test_huge_element);
    MU_RUN_TEST(test_in_box_rects_stay_on_page);
    MU_RUN_TEST(test_fit_screen_rect);
    MU_RUN_TEST(test_fit_local_rect_with_offset_view_box);
    MU_RUN_TEST(test_screen_rect_scaled_viewport);
    MU_RUN_TEST(test_percent_mode_inside_page_matches_fit);
    MU_RUN_TEST(test_percent_mode_off_page);
    MU_RUN_TEST(test_degenerate_extents);
    MU_RUN_TEST(test_degenerate_context);
    MU_RUN_TEST(test_resolve_metrics_deterministic);
    MU_RUN_TEST(test_transformed_bounds_translate);
    MU_RUN_TEST(test_transformed_bounds_mirror);
    MU_RUN_TEST(test_transformed_bounds_rotation);
    MU_RUN_TEST(test_transformed_bounds_non_finite);
    MU_RUN_TEST(test_line_points);
    MU_RUN_TEST(test_line_points_off_page_percent);
    MU_RUN_TEST(test_line_points_non_finite);
    MU_RUN_TEST(test_inset_for_text);
    MU_RUN_TEST(test_inset_for_text_fallback);
    MU_RUN_TEST(test_inset_for_text_percent);
    MU_RUN_TEST(test_resolve_radius);
    MU_RUN_TEST(test_align_x);
    MU_RUN_TEST(test_xform2d_parse);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(slide_geom_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
