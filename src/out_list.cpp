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

#include <slidify.hpp>

using namespace slidify;
using namespace std;

void ListShapeSink::begin_slide(const SlideContext &ctx, size_t index) {
    (void) ctx;
    (void) index;
    m_out.emplace_back();
}

/* Primitives arriving without a begin_slide go to an implicit first slide */
SlidePrimitives &ListShapeSink::current() {
    if (m_out.empty())
        m_out.emplace_back();
    return m_out.back();
}

ListShapeSink &ListShapeSink::operator<<(const ShapePrimitive &shape) {
    current().shapes.push_back(shape);
    return *this;
}

ListShapeSink &ListShapeSink::operator<<(const TextPrimitive &text) {
    current().texts.push_back(text);
    return *this;
}

ListShapeSink &ListShapeSink::operator<<(const LinePrimitive &line) {
    current().lines.push_back(line);
    return *this;
}

ListShapeSink &ListShapeSink::operator<<(const PlaceholderToken &tok) {
    current().placeholders.push_back(tok);
    return *this;
}
