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

#include <array>
#include <vector>
#include <string>
#include <sstream>
#include <cmath>
#include <cctype>
#include <algorithm>
#include <numbers>

using namespace std;

namespace slidify {

    typedef std::array<double, 2> d2p;

    /* 2D affine transform, cairo layout:
     *
     * | xx xy x0 |
     * | yx yy y0 |
     */
    class xform2d {
        public:
            xform2d(double xx, double xy, double yx, double yy, double x0=0.0, double y0=0.0) :
                xx(xx), xy(xy), x0(x0), yx(yx), yy(yy), y0(y0) {}

            xform2d() : xform2d(1.0, 0.0, 0.0, 1.0) {}

            /* Parse an SVG transform attribute. Transform lists are applied left to right, i.e. the rightmost
             * function is the innermost one. Anything we cannot parse leaves us at unity. */
            xform2d(const string &svg_transform) : xform2d() {
                size_t pos = 0;
                while (pos < svg_transform.size()) {
                    pos = svg_transform.find_first_not_of(" \t\r\n,", pos);
                    if (pos == string::npos)
                        return;

                    size_t open = svg_transform.find('(', pos);
                    size_t close = svg_transform.find(')', pos);
                    if (open == string::npos || close == string::npos || close < open) {
                        *this = xform2d();
                        return;
                    }

                    string name = svg_transform.substr(pos, open - pos);
                    name.erase(std::remove_if(name.begin(), name.end(), [](unsigned char c){ return std::isspace(c); }), name.end());

                    string args = svg_transform.substr(open + 1, close - open - 1);
                    std::replace(args.begin(), args.end(), ',', ' ');
                    istringstream arg_stream(args);
                    vector<double> a;
                    double val;
                    while (arg_stream >> val) {
                        a.push_back(val);
                    }

                    if (!apply_svg_function(name, a)) {
                        *this = xform2d();
                        return;
                    }

                    pos = close + 1;
                }
            }

            xform2d &translate(double x, double y) {
                xform2d xf(1, 0, 0, 1, x, y);
                transform(xf);
                return *this;
            }

            xform2d &scale(double x, double y) {
                xform2d xf(x, 0, 0, y);
                transform(xf);
                return *this;
            }

            xform2d &rotate(double theta) {
                double s = sin(theta);
                double c = cos(theta);
                xform2d xf(c, -s, s, c);
                transform(xf);
                return *this;
            }

            xform2d &skew(double mx, double my) {
                xform2d xf(1, mx, my, 1);
                transform(xf);
                return *this;
            }

            xform2d &transform(const xform2d &other) {
                double n_xx = other.xx * xx + other.yx * xy;
                double n_yx = other.xx * yx + other.yx * yy;

                double n_xy = other.xy * xx + other.yy * xy;
                double n_yy = other.xy * yx + other.yy * yy;

                double n_x0 = other.x0 * xx + other.y0 * xy + x0;
                double n_y0 = other.x0 * yx + other.y0 * yy + y0;

                xx = n_xx;
                yx = n_yx;
                xy = n_xy;
                yy = n_yy;
                x0 = n_x0;
                y0 = n_y0;

                return *this;
            };

            d2p doc2phys(const d2p p) const {
                return d2p {
                    xx * p[0] + xy * p[1] + x0,
                    yx * p[0] + yy * p[1] + y0
                };
            }

            bool finite() const {
                return isfinite(xx) && isfinite(xy) && isfinite(x0)
                    && isfinite(yx) && isfinite(yy) && isfinite(y0);
            }

        private:
            bool apply_svg_function(const string &name, const vector<double> &a) {
                if (name == "matrix" && a.size() == 6) {
                    /* SVG order is a b c d e f, i.e. column-major */
                    transform(xform2d(a[0], a[2], a[1], a[3], a[4], a[5]));

                } else if (name == "translate" && (a.size() == 1 || a.size() == 2)) {
                    translate(a[0], a.size() == 2 ? a[1] : 0.0);

                } else if (name == "scale" && (a.size() == 1 || a.size() == 2)) {
                    scale(a[0], a.size() == 2 ? a[1] : a[0]);

                } else if (name == "rotate" && (a.size() == 1 || a.size() == 3)) {
                    double theta = a[0] / 180.0 * std::numbers::pi;
                    if (a.size() == 3) {
                        translate(a[1], a[2]);
                        rotate(theta);
                        translate(-a[1], -a[2]);
                    } else {
                        rotate(theta);
                    }

                } else if (name == "skewX" && a.size() == 1) {
                    skew(tan(a[0] / 180.0 * std::numbers::pi), 0.0);

                } else if (name == "skewY" && a.size() == 1) {
                    skew(0.0, tan(a[0] / 180.0 * std::numbers::pi));

                } else {
                    return false;
                }

                return true;
            }

            double xx, xy, x0,
                   yx, yy, y0;
    };
}
