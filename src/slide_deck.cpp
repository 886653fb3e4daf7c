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

#include <istream>
#include <string>
#include <memory>
#include <utility>
#include <vector>

#include <slidify.hpp>

using namespace slidify;
using namespace std;

bool slidify::SlideDeck::add(istream &in) {
    auto doc = make_unique<SlideDocument>();
    if (!doc->load(in))
        return false;

    m_slides.push_back(std::move(doc));
    return true;
}

bool slidify::SlideDeck::add(string filename) {
    auto doc = make_unique<SlideDocument>();
    if (!doc->load(filename))
        return false;

    m_slides.push_back(std::move(doc));
    return true;
}

void slidify::SlideDeck::render(const RenderSettings &rset, const ColorSampler &sampler, ShapeSink &sink, const ElementSelector &sel) {
    sink.header(rset, m_slides.size());
    for (size_t i = 0; i < m_slides.size(); i++) {
        m_slides[i]->render_slide(rset, sampler, sink, sel, i);
    }
    sink.footer();
}

void slidify::SlideDeck::render_to_list(const RenderSettings &rset, const ColorSampler &sampler, vector<SlidePrimitives> &out, const ElementSelector &sel) {
    out.clear();
    ListShapeSink sink(out);
    render(rset, sampler, sink, sel);
}
