#pragma once
#include "uil/types.hpp"

namespace uil::geom
{
    // Axis-aligned box view shared by MatchCandidate and UIElement.
    struct Box
    {
        int x = 0, y = 0, w = 0, h = 0;

        long long area() const { return (long long)w * h; }
    };

    inline Box box_of(const MatchCandidate &m) { return {m.x, m.y, m.width, m.height}; }
    inline Box box_of(const UIElement &e) { return {e.x, e.y, e.width, e.height}; }

    long long intersection_area(const Box &a, const Box &b);
    long long union_area(const Box &a, const Box &b);

    // Intersection over union, 0 for degenerate boxes.
    double iou(const Box &a, const Box &b);

    // True when inner lies fully inside outer (edges may touch).
    bool contains(const Box &outer, const Box &inner);

    // Intersection divided by the smaller of the two areas.
    double overlap_of_smaller(const Box &a, const Box &b);

    // inner is inside outer and has less than `ratio` of its area.
    bool is_nested(const Box &inner, const Box &outer, double ratio = 0.9);
}
