#include "uil/geometry.hpp"

#include <algorithm>

namespace uil::geom
{

    long long intersection_area(const Box &a, const Box &b)
    {
        const int x0 = std::max(a.x, b.x);
        const int y0 = std::max(a.y, b.y);
        const int x1 = std::min(a.x + a.w, b.x + b.w);
        const int y1 = std::min(a.y + a.h, b.y + b.h);
        if (x1 <= x0 || y1 <= y0)
            return 0;
        return (long long)(x1 - x0) * (long long)(y1 - y0);
    }

    long long union_area(const Box &a, const Box &b)
    {
        return a.area() + b.area() - intersection_area(a, b);
    }

    double iou(const Box &a, const Box &b)
    {
        const long long u = union_area(a, b);
        if (u <= 0)
            return 0.0;
        return (double)intersection_area(a, b) / (double)u;
    }

    bool contains(const Box &outer, const Box &inner)
    {
        return inner.x >= outer.x && inner.y >= outer.y &&
               inner.x + inner.w <= outer.x + outer.w &&
               inner.y + inner.h <= outer.y + outer.h;
    }

    double overlap_of_smaller(const Box &a, const Box &b)
    {
        const long long smaller = std::min(a.area(), b.area());
        if (smaller <= 0)
            return 0.0;
        return (double)intersection_area(a, b) / (double)smaller;
    }

    bool is_nested(const Box &inner, const Box &outer, double ratio)
    {
        return contains(outer, inner) && (double)inner.area() < (double)outer.area() * ratio;
    }

} // namespace uil::geom
