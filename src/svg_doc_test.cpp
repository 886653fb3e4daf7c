#include <iostream>
#include <sstream>
#include <cmath>
#include <string>
#include <vector>

#include <slidify.hpp>

#include <minunit.h>

using namespace slidify;
using namespace std;

static const char *test_slide_svg = R"(<?xml version="1.0" encoding="UTF-8"?>
<svg xmlns="http://www.w3.org/2000/svg" width="1000" height="600" viewBox="0 0 1000 600">
  <title>Test slide</title>
  <defs><linearGradient id="unused"/></defs>
  <rect id="box" x="100" y="60" width="200" height="120" fill="red" stroke="blue" stroke-width="2"/>
  <g opacity="0.5">
    <rect id="faded" x="0" y="0" width="10" height="10" fill="red" opacity="0.5"/>
  </g>
  <rect id="skipped" class="no-export" x="0" y="0" width="10" height="10" fill="red"/>
  <rect id="undisplayed" style="display: none" x="0" y="0" width="10" height="10" fill="red"/>
  <g style="visibility: hidden">
    <rect id="hidden" x="0" y="0" width="10" height="10" fill="red"/>
  </g>
  <rect id="pres" class="card hide-on-presentation" x="0" y="0" width="10" height="10" fill="red"/>
  <rect id="invisible" x="0" y="0" width="10" height="10" fill="none"/>
  <rect id="empty" x="0" y="0" width="0" height="10" fill="red"/>
  <g transform="translate(100, 0)">
    <line id="ln" x1="0" y1="0" x2="400" y2="300" stroke="black" stroke-dasharray="4 2"/>
  </g>
  <rect id="rounded" x="10" y="10" width="50" height="50" rx="10" fill="red"/>
  <circle id="dot" cx="500" cy="300" r="50" fill="blue"/>
  <g name="@updateDate" font-size="16px" fill="#336699" style="text-align: right">
    <rect x="800" y="500" width="100" height="50" fill="none"/>
  </g>
  <frobnicator/>
</svg>
)";

static bool load_string(SlideDocument &doc, const char *svg) {
    istringstream in(svg);
    return doc.load(in);
}

static RenderSettings test_settings(SizingMode mode=SIZING_FIT) {
    RenderSettings rset;
    rset.slide_width_in = 10.0;
    rset.slide_height_in = 6.0;
    rset.sizing = mode;
    return rset;
}

static const ShapePrimitive *find_shape(const SlidePrimitives &prims, const string &id) {
    for (const auto &s : prims.shapes)
        if (s.id == id)
            return &s;
    return nullptr;
}

MU_TEST(test_load_rejects_garbage) {
    SlideDocument doc;
    mu_assert(!load_string(doc, "this is not xml <"), "garbage accepted");
    mu_assert(!doc.valid(), "document valid after failed load");

    SlideDocument doc2;
    mu_assert(!load_string(doc2, "<html><body/></html>"), "document without <svg> root accepted");
}

MU_TEST(test_load_size_fallbacks) {
    SlideDocument doc;
    mu_assert(load_string(doc, "<svg xmlns=\"http://www.w3.org/2000/svg\"/>"), "bare svg rejected");
    mu_assert_double_eq(1920.0, doc.width());
    mu_assert_double_eq(1080.0, doc.height());

    SlideDocument doc2;
    mu_assert(load_string(doc2, "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"10,20,500,250\"/>"), "viewBox-only svg rejected");
    mu_assert_double_eq(500.0, doc2.width());
    mu_assert_double_eq(250.0, doc2.height());
    mu_assert_double_eq(10.0, doc2.logical_box().min_x);
    mu_assert_double_eq(20.0, doc2.logical_box().min_y);

    SlideDocument doc3;
    mu_assert(load_string(doc3, "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"2in\" height=\"1in\"/>"), "svg with units rejected");
    mu_assert_double_eq(192.0, doc3.width());
    mu_assert_double_eq(96.0, doc3.height());
    mu_assert_double_eq(192.0, doc3.logical_box().width);
}

MU_TEST(test_render_shapes) {
    SlideDocument doc;
    mu_assert(load_string(doc, test_slide_svg), "test slide rejected");

    CairoColorSampler sampler;
    SlidePrimitives prims;
    doc.render_to_list(test_settings(), sampler, prims);

    const ShapePrimitive *box = find_shape(prims, "box");
    mu_assert(box, "box not exported");
    mu_assert_int_eq(SHAPE_RECT, box->kind);
    mu_assert_int_eq(914400, (int)box->metrics.x.absolute());
    mu_assert_int_eq(548640, (int)box->metrics.y.absolute());
    mu_assert_int_eq(1828800, (int)box->metrics.w);
    mu_assert_int_eq(1097280, (int)box->metrics.h);
    mu_assert_string_eq("#ff0000", box->fill.hex.c_str());
    mu_assert_double_eq(1.0, box->fill.alpha);
    mu_assert(box->has_line, "box stroke missing");
    mu_assert_string_eq("#0000ff", box->line.color.hex.c_str());
    mu_assert_int_eq(19050, (int)box->line.weight_emu);

    const ShapePrimitive *faded = find_shape(prims, "faded");
    mu_assert(faded, "faded rect not exported");
    mu_assert(fabs(faded->fill.alpha - 0.25) < 1e-9, "group opacity not composed");

    const ShapePrimitive *rounded = find_shape(prims, "rounded");
    mu_assert(rounded, "rounded rect not exported");
    mu_assert_int_eq(SHAPE_ROUND_RECT, rounded->kind);
    mu_assert_double_eq(0.05, rounded->radius_ratio);

    const ShapePrimitive *dot = find_shape(prims, "dot");
    mu_assert(dot, "circle not exported");
    mu_assert_int_eq(SHAPE_ELLIPSE, dot->kind);
    mu_assert_int_eq(4114800, (int)dot->metrics.x.absolute());
    mu_assert_int_eq(914400, (int)dot->metrics.w);
    mu_assert_string_eq("#0000ff", dot->fill.hex.c_str());

    mu_assert(!find_shape(prims, "skipped"), "no-export element exported");
    mu_assert(!find_shape(prims, "undisplayed"), "display: none element exported");
    mu_assert(!find_shape(prims, "hidden"), "element in hidden group exported");
    mu_assert(!find_shape(prims, "invisible"), "shape without fill and stroke exported");
    mu_assert(!find_shape(prims, "empty"), "zero-area shape exported");
    mu_assert(find_shape(prims, "pres"), "hide-on-presentation element skipped outside presentation mode");
    mu_assert_int_eq(5, (int)prims.shapes.size());
}

MU_TEST(test_render_line) {
    SlideDocument doc;
    mu_assert(load_string(doc, test_slide_svg), "test slide rejected");

    CairoColorSampler sampler;
    SlidePrimitives prims;
    doc.render_to_list(test_settings(), sampler, prims);

    mu_assert_int_eq(1, (int)prims.lines.size());
    const LinePrimitive &ln = prims.lines[0];
    mu_assert_string_eq("ln", ln.id.c_str());
    mu_assert_int_eq(914400, (int)ln.points.start.x.absolute());
    mu_assert_int_eq(0, (int)ln.points.start.y.absolute());
    mu_assert_int_eq(4572000, (int)ln.points.end.x.absolute());
    mu_assert_int_eq(2743200, (int)ln.points.end.y.absolute());
    mu_assert_int_eq(9525, (int)ln.line.weight_emu);
    mu_assert_int_eq(DASH_DASHED, ln.line.dash);
    mu_assert_string_eq("#000000", ln.line.color.hex.c_str());
}

MU_TEST(test_render_placeholder) {
    SlideDocument doc;
    mu_assert(load_string(doc, test_slide_svg), "test slide rejected");

    CairoColorSampler sampler;
    SlidePrimitives prims;
    doc.render_to_list(test_settings(), sampler, prims);

    mu_assert_int_eq(1, (int)prims.placeholders.size());
    const PlaceholderToken &tok = prims.placeholders[0];
    mu_assert_string_eq("@updateDate", tok.name.c_str());
    /* Date box is twice as wide as its template and right-aligned against it */
    mu_assert_int_eq(1828800, (int)tok.metrics.w);
    mu_assert_int_eq(6400800, (int)tok.metrics.x.absolute());
    mu_assert_int_eq(4572000, (int)tok.metrics.y.absolute());
    mu_assert_int_eq(ALIGN_RIGHT, tok.alignment.align);
    mu_assert_double_eq(12.0, tok.font.size_pt);
    mu_assert_string_eq("#336699", tok.color.hex.c_str());
}

MU_TEST(test_render_selector) {
    SlideDocument doc;
    mu_assert(load_string(doc, test_slide_svg), "test slide rejected");

    CairoColorSampler sampler;
    ElementSelector sel;
    sel.presentation_mode = true;
    sel.exclude_classes.push_back("nothing-matches");
    SlidePrimitives prims;
    doc.render_to_list(test_settings(), sampler, prims, sel);
    mu_assert(!find_shape(prims, "pres"), "hide-on-presentation element exported in presentation mode");
    mu_assert(find_shape(prims, "box"), "box missing in presentation mode");

    ElementSelector sel2;
    sel2.exclude_classes.push_back("card");
    SlidePrimitives prims2;
    doc.render_to_list(test_settings(), sampler, prims2, sel2);
    mu_assert(!find_shape(prims2, "pres"), "excluded class exported");
}

MU_TEST(test_render_scaled_view_box) {
    /* Same content as 1000x600 user units, shown on a 2000x1200 px page */
    SlideDocument doc;
    mu_assert(load_string(doc, R"(<svg xmlns="http://www.w3.org/2000/svg" width="2000" height="1200" viewBox="0 0 1000 600">
        <g transform="scale(2)"><rect id="r" x="50" y="30" width="100" height="60" fill="red"/></g>
    </svg>)"), "scaled slide rejected");

    CairoColorSampler sampler;
    SlidePrimitives prims;
    doc.render_to_list(test_settings(), sampler, prims);

    const ShapePrimitive *r = find_shape(prims, "r");
    mu_assert(r, "rect not exported");
    mu_assert_int_eq(914400, (int)r->metrics.x.absolute());
    mu_assert_int_eq(548640, (int)r->metrics.y.absolute());
    mu_assert_int_eq(1828800, (int)r->metrics.w);
    mu_assert_int_eq(1097280, (int)r->metrics.h);
}

MU_TEST(test_render_percent_mode) {
    SlideDocument doc;
    mu_assert(load_string(doc, R"(<svg xmlns="http://www.w3.org/2000/svg" width="1000" height="600">
        <rect id="off" x="-100" y="60" width="200" height="120" fill="red"/>
    </svg>)"), "slide rejected");

    CairoColorSampler sampler;
    SlidePrimitives fit, pct;
    doc.render_to_list(test_settings(SIZING_FIT), sampler, fit);
    doc.render_to_list(test_settings(SIZING_VIEWPORT_PERCENT), sampler, pct);

    mu_assert_int_eq(1, (int)fit.shapes.size());
    mu_assert_int_eq(1, (int)pct.shapes.size());
    mu_assert(!fit.shapes[0].metrics.x.is_percent(), "fit mode produced a percentage");
    mu_assert_int_eq(-914400, (int)fit.shapes[0].metrics.x.absolute());
    mu_assert(pct.shapes[0].metrics.x.is_percent(), "percent mode did not produce a percentage");
    mu_assert(fabs(pct.shapes[0].metrics.x.percent_value() + 10.0) < 1e-9, "wrong percentage");
    mu_assert(!pct.shapes[0].metrics.y.is_percent(), "on-page y turned into a percentage");
}

MU_TEST(test_sexp_output) {
    SlideDocument doc;
    mu_assert(load_string(doc, R"(<svg xmlns="http://www.w3.org/2000/svg" width="1000" height="600">
        <rect id="r" x="100" y="60" width="200" height="120" fill="red"/>
    </svg>)"), "slide rejected");

    CairoColorSampler sampler;
    ostringstream out;
    SexpSlideOutput sink(out);
    doc.render(test_settings(), sampler, sink);

    string s = out.str();
    mu_assert(s.find("(deck ") == 0, "missing header");
    mu_assert(s.find("(size 9144000 5486400)") != string::npos, "missing slide size");
    mu_assert(s.find("(slides 1)") != string::npos, "missing slide count");
    mu_assert(s.find("\n  (slide 1 (viewport 1000 600) (view-box 0 0 1000 600)\n") != string::npos, "missing slide block");
    mu_assert(s.find("(shape rect (id \"r\") (at 914400 548640) (size 1828800 1097280) (fill \"#ff0000\" 1))") != string::npos,
            "rect not serialized as expected");

    ostringstream bare;
    SexpSlideOutput bare_sink(bare, true);
    doc.render(test_settings(), sampler, bare_sink);
    mu_assert(bare.str().find("(deck ") == string::npos, "header written despite only_shapes");
    mu_assert(bare.str().find("(slide ") == string::npos, "slide block written despite only_shapes");
    mu_assert(bare.str().find("  (shape rect (id \"r\")") == 0, "primitive missing from bare output");
}

static const char *first_deck_slide = R"(<svg xmlns="http://www.w3.org/2000/svg" width="1000" height="600">
    <rect id="a" x="100" y="60" width="200" height="120" fill="red"/>
</svg>)";

/* Different viewport and viewBox, same output page */
static const char *second_deck_slide = R"(<svg xmlns="http://www.w3.org/2000/svg" width="500" height="300" viewBox="-50 -30 500 300">
    <rect id="b" x="-50" y="-30" width="250" height="150" fill="blue"/>
    <line id="l" x1="0" y1="0" x2="50" y2="0" stroke="black"/>
</svg>)";

static bool add_string(SlideDeck &deck, const char *svg) {
    istringstream in(svg);
    return deck.add(in);
}

MU_TEST(test_deck_load) {
    SlideDeck deck;
    mu_assert(deck.empty(), "new deck not empty");
    mu_assert(add_string(deck, first_deck_slide), "first slide rejected");
    mu_assert(!add_string(deck, "<html/>"), "slide without <svg> root accepted");
    mu_assert(add_string(deck, second_deck_slide), "second slide rejected");
    mu_assert_int_eq(2, (int)deck.size());
    mu_assert_double_eq(500.0, deck[1].width());
    mu_assert_double_eq(-50.0, deck[1].logical_box().min_x);
    mu_assert(!deck.add(string("/nonexistent/slide.svg")), "missing file accepted");
    mu_assert_int_eq(2, (int)deck.size());
}

MU_TEST(test_deck_render_to_list) {
    SlideDeck deck;
    mu_assert(add_string(deck, first_deck_slide), "first slide rejected");
    mu_assert(add_string(deck, second_deck_slide), "second slide rejected");

    CairoColorSampler sampler;
    vector<SlidePrimitives> slides;
    deck.render_to_list(test_settings(), sampler, slides);

    mu_assert_int_eq(2, (int)slides.size());
    mu_assert_int_eq(1, (int)slides[0].shapes.size());
    mu_assert_int_eq(0, (int)slides[0].lines.size());
    mu_assert_int_eq(1, (int)slides[1].shapes.size());
    mu_assert_int_eq(1, (int)slides[1].lines.size());

    mu_assert(find_shape(slides[0], "a"), "first slide content missing");
    mu_assert(!find_shape(slides[0], "b"), "second slide content leaked into the first slide");

    /* Each slide is projected through its own viewBox onto the shared page */
    const ShapePrimitive *b = find_shape(slides[1], "b");
    mu_assert(b, "second slide content missing");
    mu_assert_int_eq(0, (int)b->metrics.x.absolute());
    mu_assert_int_eq(0, (int)b->metrics.y.absolute());
    mu_assert_int_eq(4572000, (int)b->metrics.w);
    mu_assert_int_eq(2743200, (int)b->metrics.h);

    const LinePrimitive &l = slides[1].lines[0];
    mu_assert_int_eq(914400, (int)l.points.start.x.absolute());
    mu_assert_int_eq(548640, (int)l.points.start.y.absolute());
    mu_assert_int_eq(1828800, (int)l.points.end.x.absolute());

    /* Rendering again replaces the previous result */
    deck.render_to_list(test_settings(), sampler, slides);
    mu_assert_int_eq(2, (int)slides.size());
}

MU_TEST(test_deck_sexp_output) {
    SlideDeck deck;
    mu_assert(add_string(deck, first_deck_slide), "first slide rejected");
    mu_assert(add_string(deck, second_deck_slide), "second slide rejected");

    CairoColorSampler sampler;
    ostringstream out;
    SexpSlideOutput sink(out);
    deck.render(test_settings(), sampler, sink);

    string s = out.str();
    mu_assert(s.find("(deck ") == 0, "missing header");
    mu_assert(s.find("(slides 2)") != string::npos, "missing slide count");

    size_t first = s.find("\n  (slide 1 ");
    size_t second = s.find("\n  (slide 2 (viewport 500 300) (view-box -50 -30 500 300)\n");
    size_t a = s.find("\n    (shape rect (id \"a\")");
    size_t b = s.find("\n    (shape rect (id \"b\")");
    mu_assert(first != string::npos && second != string::npos, "slide blocks missing");
    mu_assert(a != string::npos && b != string::npos, "slide primitives missing");
    mu_assert(first < a && a < second && second < b, "primitives not grouped by slide");

    /* Two closed slide blocks and the closed deck */
    size_t closes = 0;
    for (size_t pos = s.find("\n  )\n"); pos != string::npos; pos = s.find("\n  )\n", pos + 1))
        closes++;
    mu_assert_int_eq(2, (int)closes);
    mu_assert(s.size() >= 3 && s.compare(s.size() - 3, 3, "\n)\n") == 0, "deck not closed");
}

MU_TEST(test_deck_svg_output) {
    SlideDeck deck;
    mu_assert(add_string(deck, first_deck_slide), "first slide rejected");
    mu_assert(add_string(deck, second_deck_slide), "second slide rejected");

    CairoColorSampler sampler;
    ostringstream out;
    SimpleSVGOutput sink(out);
    deck.render(test_settings(), sampler, sink);

    string s = out.str();
    /* Two 5486400 high pages with a 274320 gap */
    mu_assert(s.find("viewBox=\"0 0 9144000 11247120\"") != string::npos, "deck size wrong");
    mu_assert(s.find("<svg id=\"slide-1\" y=\"0\" width=\"9144000\" height=\"5486400\"") != string::npos, "first page missing");
    mu_assert(s.find("<svg id=\"slide-2\" y=\"5760720\" width=\"9144000\" height=\"5486400\"") != string::npos, "second page missing");
}

MU_TEST_SUITE(svg_doc_suite) {
    MU_RUN_TEST(test_load_rejects_garbage);
    MU_RUN_TEST(test_load_size_fallbacks);
    MU_RUN_TEST(test_render_shapes);
    MU_RUN_TEST(test_render_line);
    MU_RUN_TEST(test_render_placeholder);
    MU_RUN_TEST(test_render_selector);
    MU_RUN_TEST(test_render_scaled_view_box);
    MU_RUN_TEST(test_render_percent_mode);
    MU_RUN_TEST(test_sexp_output);
    MU_RUN_TEST(test_deck_load);
    MU_RUN_TEST(test_deck_render_to_list);
    MU_RUN_TEST(test_deck_sexp_output);
    MU_RUN_TEST(test_deck_svg_output);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(svg_doc_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
