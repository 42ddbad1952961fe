#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "uil/types.hpp"

namespace uil
{
    enum class ScreenPosition
    {
        Any,
        Top,
        Bottom,
        Center,
        Left,
        Right
    };

    // "top" | "bottom" | "center" | "left" | "right"; anything else -> Any
    ScreenPosition parse_screen_position(const std::string &name);

    struct ElementQuery
    {
        std::string type;            // exact element type, empty = any
        double min_confidence = 0.6;
        ScreenPosition position = ScreenPosition::Any;
    };

    struct ScoredElement
    {
        UIElement element;
        double score = 0.0;
    };

    // Filters by type and confidence, then scores what is left for clicking:
    // color buttons and rectangles/circles are favoured, as are mid-sized
    // elements and those in the preferred part of the screen.
    std::vector<ScoredElement> rank_elements(const std::vector<UIElement> &elements,
                                             const ElementQuery &query,
                                             const cv::Size &screen);

    // Highest scoring element; false when nothing passes the filters.
    bool select_best_element(const std::vector<UIElement> &elements,
                             const ElementQuery &query,
                             const cv::Size &screen,
                             ScoredElement &best);
}
