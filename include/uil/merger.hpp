#pragma once
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    struct MergeParams
    {
        double prefer_color_overlap = 0.5; // of the smaller area, exclusive
        double nested_area_ratio = 0.9;
        double duplicate_overlap = 0.7; // of the smaller area, inclusive
        size_t max_results = 100;
    };

    // Reconciles edge-based and color-based detections:
    //  1. each color element (by confidence, descending) replaces the first
    //     shape element whose overlap exceeds half the smaller box;
    //  2. drops elements nested inside a clearly larger one;
    //  3. drops near duplicates of elements already kept;
    //  4. sorts by area (descending) and caps the count.
    std::vector<UIElement> merge(const std::vector<UIElement> &shapes,
                                 const std::vector<UIElement> &colors,
                                 const MergeParams &p = MergeParams());

    // Individual steps, exposed for callers that already have one merged list.
    std::vector<UIElement> remove_nested(const std::vector<UIElement> &elements,
                                         double area_ratio = 0.9);
    std::vector<UIElement> remove_duplicates(const std::vector<UIElement> &elements,
                                             double overlap = 0.7);
}
