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

#include <cstdlib>
#include <cstring>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <map>
#include <numbers>
#include <sstream>
#include <vector>

#include <cairo.h>

#include <slidify.hpp>
#include "svg_color.h"
#include "svg_import_util.h"

using namespace slidify;
using namespace std;

namespace {

const map<string, uint32_t> css_named_colors {
    {"aliceblue", 0xf0f8ff}, {"antiquewhite", 0xfaebd7}, {"aqua", 0x00ffff},
    {"aquamarine", 0x7fffd4}, {"azure", 0xf0ffff}, {"beige", 0xf5f5dc},
    {"bisque", 0xffe4c4}, {"black", 0x000000}, {"blanchedalmond", 0xffebcd},
    {"blue", 0x0000ff}, {"blueviolet", 0x8a2be2}, {"brown", 0xa52a2a},
    {"burlywood", 0xdeb887}, {"cadetblue", 0x5f9ea0}, {"chartreuse", 0x7fff00},
    {"chocolate", 0xd2691e}, {"coral", 0xff7f50}, {"cornflowerblue", 0x6495ed},
    {"cornsilk", 0xfff8dc}, {"crimson", 0xdc143c}, {"cyan", 0x00ffff},
    {"darkblue", 0x00008b}, {"darkcyan", 0x008b8b}, {"darkgoldenrod", 0xb8860b},
    {"darkgray", 0xa9a9a9}, {"darkgreen", 0x006400}, {"darkgrey", 0xa9a9a9},
    {"darkkhaki", 0xbdb76b}, {"darkmagenta", 0x8b008b}, {"darkolivegreen", 0x556b2f},
    {"darkorange", 0xff8c00}, {"darkorchid", 0x9932cc}, {"darkred", 0x8b0000},
    {"darksalmon", 0xe9967a}, {"darkseagreen", 0x8fbc8f}, {"darkslateblue", 0x483d8b},
    {"darkslategray", 0x2f4f4f}, {"darkslategrey", 0x2f4f4f}, {"darkturquoise", 0x00ced1},
    {"darkviolet", 0x9400d3}, {"deeppink", 0xff1493}, {"deepskyblue", 0x00bfff},
    {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1e90ff},
    {"firebrick", 0xb22222}, {"floralwhite", 0xfffaf0}, {"forestgreen", 0x228b22},
    {"fuchsia", 0xff00ff}, {"gainsboro", 0xdcdcdc}, {"ghostwhite", 0xf8f8ff},
    {"gold", 0xffd700}, {"goldenrod", 0xdaa520}, {"gray", 0x808080},
    {"green", 0x008000}, {"greenyellow", 0xadff2f}, {"grey", 0x808080},
    {"honeydew", 0xf0fff0}, {"hotpink", 0xff69b4}, {"indianred", 0xcd5c5c},
    {"indigo", 0x4b0082}, {"ivory", 0xfffff0}, {"khaki", 0xf0e68c},
    {"lavender", 0xe6e6fa}, {"lavenderblush", 0xfff0f5}, {"lawngreen", 0x7cfc00},
    {"lemonchiffon", 0xfffacd}, {"lightblue", 0xadd8e6}, {"lightcoral", 0xf08080},
    {"lightcyan", 0xe0ffff}, {"lightgoldenrodyellow", 0xfafad2}, {"lightgray", 0xd3d3d3},
    {"lightgreen", 0x90ee90}, {"lightgrey", 0xd3d3d3}, {"lightpink", 0xffb6c1},
    {"lightsalmon", 0xffa07a}, {"lightseagreen", 0x20b2aa}, {"lightskyblue", 0x87cefa},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xb0c4de},
    {"lightyellow", 0xffffe0}, {"lime", 0x00ff00}, {"limegreen", 0x32cd32},
    {"linen", 0xfaf0e6}, {"magenta", 0xff00ff}, {"maroon", 0x800000},
    {"mediumaquamarine", 0x66cdaa}, {"mediumblue", 0x0000cd}, {"mediumorchid", 0xba55d3},
    {"mediumpurple", 0x9370db}, {"mediumseagreen", 0x3cb371}, {"mediumslateblue", 0x7b68ee},
    {"mediumspringgreen", 0x00fa9a}, {"mediumturquoise", 0x48d1cc}, {"mediumvioletred", 0xc71585},
    {"midnightblue", 0x191970}, {"mintcream", 0xf5fffa}, {"mistyrose", 0xffe4e1},
    {"moccasin", 0xffe4b5}, {"navajowhite", 0xffdead}, {"navy", 0x000080},
    {"oldlace", 0xfdf5e6}, {"olive", 0x808000}, {"olivedrab", 0x6b8e23},
    {"orange", 0xffa500}, {"orangered", 0xff4500}, {"orchid", 0xda70d6},
    {"palegoldenrod", 0xeee8aa}, {"palegreen", 0x98fb98}, {"paleturquoise", 0xafeeee},
    {"palevioletred", 0xdb7093}, {"papayawhip", 0xffefd5}, {"peachpuff", 0xffdab9},
    {"peru", 0xcd853f}, {"pink", 0xffc0cb}, {"plum", 0xdda0dd},
    {"powderblue", 0xb0e0e6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
    {"red", 0xff0000}, {"rosybrown", 0xbc8f8f}, {"royalblue", 0x4169e1},
    {"saddlebrown", 0x8b4513}, {"salmon", 0xfa8072}, {"sandybrown", 0xf4a460},
    {"seagreen", 0x2e8b57}, {"seashell", 0xfff5ee}, {"sienna", 0xa0522d},
    {"silver", 0xc0c0c0}, {"skyblue", 0x87ceeb}, {"slateblue", 0x6a5acd},
    {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xfffafa},
    {"springgreen", 0x00ff7f}, {"steelblue", 0x4682b4}, {"tan", 0xd2b48c},
    {"teal", 0x008080}, {"thistle", 0xd8bfd8}, {"tomato", 0xff6347},
    {"turquoise", 0x40e0d0}, {"violet", 0xee82ee}, {"wheat", 0xf5deb3},
    {"white", 0xffffff}, {"whitesmoke", 0xf5f5f5}, {"yellow", 0xffff00},
    {"yellowgreen", 0x9acd32},
};

/* "50%" -> 0.5 * percent_scale, "128" -> 128 * number_scale. false on garbage. */
bool parse_component(const string &tok, double number_scale, double percent_scale, double &out) {
    const char *c = tok.c_str();
    char *endptr = nullptr;
    double val = strtod(c, &endptr);
    if (endptr == c || !isfinite(val))
        return false;

    if (*endptr == '%') {
        out = val / 100.0 * percent_scale;
        endptr++;
    } else {
        out = val * number_scale;
    }

    return *endptr == '\0';
}

vector<string> split_function_args(string args) {
    std::replace(args.begin(), args.end(), ',', ' ');
    std::replace(args.begin(), args.end(), '/', ' ');
    istringstream ss(args);
    vector<string> out;
    string tok;
    while (ss >> tok) {
        out.push_back(tok);
    }
    return out;
}

double hue_to_rgb(double p, double q, double t) {
    if (t < 0) t += 1;
    if (t > 1) t -= 1;
    if (t < 1.0/6) return p + (q - p) * 6 * t;
    if (t < 1.0/2) return q;
    if (t < 2.0/3) return p + (q - p) * (2.0/3 - t) * 6;
    return p;
}

} /* anonymous namespace */

bool slidify::RGBColor::parse(const string &css) {
    string s = to_lower(trim(css));
    if (s.empty() || s == "none" || s == "currentcolor")
        return false;

    if (s == "transparent") {
        r = g = b = a = 0.0;
        return true;
    }

    if (s[0] == '#')
        return parse_hex(s.substr(1));

    auto open = s.find('(');
    if (open != string::npos) {
        if (s.back() != ')')
            return false;

        string fun = trim(s.substr(0, open));
        string args = s.substr(open + 1, s.size() - open - 2);
        if (fun == "rgb" || fun == "rgba")
            return parse_rgb_function(args);
        if (fun == "hsl" || fun == "hsla")
            return parse_hsl_function(args);
        return false;
    }

    return parse_named(s);
}

bool slidify::RGBColor::parse_hex(const string &hex) {
    size_t len = hex.size();
    if (len != 3 && len != 4 && len != 6 && len != 8)
        return false;

    if (hex.find_first_not_of("0123456789abcdef") != string::npos)
        return false;

    unsigned long val = strtoul(hex.c_str(), nullptr, 16);
    double ch[4] = {0, 0, 0, 255};
    if (len == 3 || len == 4) {
        int n = (int)len;
        for (int i=0; i<n; i++) {
            unsigned long nib = (val >> (4 * (n - 1 - i))) & 0xf;
            ch[i] = nib * 17;
        }
    } else {
        int n = (int)len / 2;
        for (int i=0; i<n; i++) {
            ch[i] = (val >> (8 * (n - 1 - i))) & 0xff;
        }
    }

    r = ch[0] / 255.0;
    g = ch[1] / 255.0;
    b = ch[2] / 255.0;
    a = ch[3] / 255.0;
    return true;
}

bool slidify::RGBColor::parse_rgb_function(const string &args) {
    auto toks = split_function_args(args);
    if (toks.size() != 3 && toks.size() != 4)
        return false;

    double ch[4] = {0, 0, 0, 1.0};
    for (size_t i=0; i<3; i++) {
        if (!parse_component(toks[i], 1.0/255.0, 1.0, ch[i]))
            return false;
    }
    if (toks.size() == 4 && !parse_component(toks[3], 1.0, 1.0, ch[3]))
        return false;

    r = std::clamp(ch[0], 0.0, 1.0);
    g = std::clamp(ch[1], 0.0, 1.0);
    b = std::clamp(ch[2], 0.0, 1.0);
    a = std::clamp(ch[3], 0.0, 1.0);
    return true;
}

bool slidify::RGBColor::parse_hsl_function(const string &args) {
    auto toks = split_function_args(args);
    if (toks.size() != 3 && toks.size() != 4)
        return false;

    const char *c = toks[0].c_str();
    char *endptr = nullptr;
    double h = strtod(c, &endptr);
    if (endptr == c || !isfinite(h))
        return false;

    string unit(endptr);
    if (unit == "rad")
        h = h * 180.0 / std::numbers::pi;
    else if (unit == "turn")
        h = h * 360.0;
    else if (unit == "grad")
        h = h * 0.9;
    else if (!unit.empty() && unit != "deg")
        return false;

    double s, l, alpha = 1.0;
    if (!parse_component(toks[1], 1.0/100.0, 1.0, s) || !parse_component(toks[2], 1.0/100.0, 1.0, l))
        return false;
    if (toks.size() == 4 && !parse_component(toks[3], 1.0, 1.0, alpha))
        return false;

    h = fmod(fmod(h, 360.0) + 360.0, 360.0) / 360.0;
    s = std::clamp(s, 0.0, 1.0);
    l = std::clamp(l, 0.0, 1.0);

    if (s == 0) {
        r = g = b = l;
    } else {
        double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
        double p = 2 * l - q;
        r = hue_to_rgb(p, q, h + 1.0/3);
        g = hue_to_rgb(p, q, h);
        b = hue_to_rgb(p, q, h - 1.0/3);
    }
    a = std::clamp(alpha, 0.0, 1.0);
    return true;
}

bool slidify::RGBColor::parse_named(const string &name) {
    auto it = css_named_colors.find(name);
    if (it == css_named_colors.end())
        return false;

    r = ((it->second >> 16) & 0xff) / 255.0;
    g = ((it->second >>  8) & 0xff) / 255.0;
    b = ((it->second >>  0) & 0xff) / 255.0;
    a = 1.0;
    return true;
}

namespace slidify {
    class CairoColorSampler_D {
    public:
        cairo_surface_t *surface = nullptr;
        cairo_t *cr = nullptr;
    };
}

slidify::CairoColorSampler::CairoColorSampler() : d(new CairoColorSampler_D) {
}

slidify::CairoColorSampler::~CairoColorSampler() {
    if (d->cr)
        cairo_destroy(d->cr);
    if (d->surface)
        cairo_surface_destroy(d->surface);
    delete d;
}

RGBA slidify::CairoColorSampler::sample(const string &css_color) const {
    RGBColor color;
    if (!color.parse(css_color))
        return RGBA();

    if (!d->surface) {
        d->surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, 1, 1);
        d->cr = cairo_create(d->surface);
    }

    if (cairo_status(d->cr) != CAIRO_STATUS_SUCCESS)
        return RGBA();

    /* Replace the pixel instead of compositing onto whatever the last sample left behind */
    cairo_set_operator(d->cr, CAIRO_OPERATOR_SOURCE);
    cairo_set_source_rgba(d->cr, color.r, color.g, color.b, color.a);
    cairo_paint(d->cr);
    cairo_surface_flush(d->surface);

    /* CAIRO_FORMAT_ARGB32 is one native-endian 32 bit word per pixel with premultiplied alpha */
    uint32_t px;
    memcpy(&px, cairo_image_surface_get_data(d->surface), sizeof(px));
    unsigned int pa = (px >> 24) & 0xff;
    if (pa == 0)
        return RGBA();

    auto unpremultiply = [pa](unsigned int c) -> uint8_t {
        return static_cast<uint8_t>(std::min(255u, (c * 255 + pa / 2) / pa));
    };

    RGBA out;
    out.r = unpremultiply((px >> 16) & 0xff);
    out.g = unpremultiply((px >>  8) & 0xff);
    out.b = unpremultiply((px >>  0) & 0xff);
    out.a = static_cast<uint8_t>(pa);
    return out;
}
