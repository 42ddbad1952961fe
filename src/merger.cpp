#include "uil/merger.hpp"
#include "uil/geometry.hpp"
#include "uil/log.hpp"

#include <algorithm>
#include <string>

namespace uil
{

    std::vector<UIElement> remove_nested(const std::vector<UIElement> &elements, double area_ratio)
    {
        std::vector<UIElement> kept;
        kept.reserve(elements.size());
        for (size_t i = 0; i < elements.size(); ++i)
        {
            const geom::Box a = geom::box_of(elements[i]);
            bool nested = false;
            for (size_t j = 0; j < elements.size() && !nested; ++j)
                nested = (i != j) && geom::is_nested(a, geom::box_of(elements[j]), area_ratio);
            if (!nested)
                kept.push_back(elements[i]);
        }
        return kept;
    }

    std::vector<UIElement> remove_duplicates(const std::vector<UIElement> &elements, double overlap)
    {
        std::vector<UIElement> kept;
        kept.reserve(elements.size());
        for (const auto &e : elements)
        {
            const geom::Box b = geom::box_of(e);
            const bool dup = std::any_of(kept.begin(), kept.end(), [&](const UIElement &k)
                                         { return geom::overlap_of_smaller(b, geom::box_of(k)) >= overlap; });
            if (!dup)
                kept.push_back(e);
        }
        return kept;
    }

    std::vector<UIElement> merge(const std::vector<UIElement> &shapes,
                                 const std::vector<UIElement> &colors,
                                 const MergeParams &p)
    {
        std::vector<UIElement> byConf = colors;
        std::stable_sort(byConf.begin(), byConf.end(), [](const UIElement &a, const UIElement &b)
                         { return a.confidence > b.confidence; });

        // ---- 1. color beats edges ----
        std::vector<UIElement> remaining = shapes;
        std::vector<UIElement> merged;
        merged.reserve(shapes.size() + colors.size());
        for (const auto &c : byConf)
        {
            const geom::Box cb = geom::box_of(c);
            // first remaining shape (detector order) that the color box covers
            const auto hit = std::find_if(remaining.begin(), remaining.end(), [&](const UIElement &s)
                                          { return geom::overlap_of_smaller(cb, geom::box_of(s)) > p.prefer_color_overlap; });
            if (hit != remaining.end())
                remaining.erase(hit);
            merged.push_back(c);
        }
        merged.insert(merged.end(), remaining.begin(), remaining.end());

        // ---- 2. nesting, 3. duplicates ----
        auto result = remove_duplicates(remove_nested(merged, p.nested_area_ratio),
                                        p.duplicate_overlap);

        // ---- 4. rank ----
        std::stable_sort(result.begin(), result.end(), [](const UIElement &a, const UIElement &b)
                         { return a.area > b.area; });
        if (result.size() > p.max_results)
            result.resize(p.max_results);

        uil::log::d("merge: " + std::to_string(shapes.size()) + " shape + " +
                    std::to_string(colors.size()) + " color -> " + std::to_string(result.size()));
        return result;
    }

} // namespace uil
