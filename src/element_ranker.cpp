#include "uil/element_ranker.hpp"

#include <algorithm>

namespace uil
{

    namespace
    {
        struct Params
        {
            double COLOR_BONUS = 0.2;
            double SHAPE_BONUS = 0.1; // rectangle / circle
            double SIZE_BONUS = 0.1;
            double SIZE_MIN_FRAC = 0.001;
            double SIZE_MAX_FRAC = 0.3;
            double POSITION_BONUS = 0.15;
            double EDGE_BAND = 0.3; // top/left band; bottom/right is 1 - EDGE_BAND
        };
        const Params P{};

        bool in_position(const UIElement &e, ScreenPosition pos, const cv::Size &screen)
        {
            if (screen.width <= 0 || screen.height <= 0)
                return false;
            const double cx = (double)e.center_x / screen.width;
            const double cy = (double)e.center_y / screen.height;
            const double lo = P.EDGE_BAND, hi = 1.0 - P.EDGE_BAND;
            switch (pos)
            {
            case ScreenPosition::Top:
                return cy < lo;
            case ScreenPosition::Bottom:
                return cy > hi;
            case ScreenPosition::Center:
                return cy > lo && cy < hi;
            case ScreenPosition::Left:
                return cx < lo;
            case ScreenPosition::Right:
                return cx > hi;
            case ScreenPosition::Any:
                break;
            }
            return false;
        }

        double score_of(const UIElement &e, const ElementQuery &q, const cv::Size &screen)
        {
            double s = e.confidence;
            if (e.type.rfind("color_button_", 0) == 0)
                s += P.COLOR_BONUS;
            if (e.type == "rectangle" || e.type == "circle")
                s += P.SHAPE_BONUS;

            const double screenArea = (double)screen.width * screen.height;
            if (screenArea > 0)
            {
                const double frac = e.area / screenArea;
                if (frac > P.SIZE_MIN_FRAC && frac < P.SIZE_MAX_FRAC)
                    s += P.SIZE_BONUS;
            }
            if (q.position != ScreenPosition::Any && in_position(e, q.position, screen))
                s += P.POSITION_BONUS;
            return s;
        }
    } // namespace

    ScreenPosition parse_screen_position(const std::string &name)
    {
        if (name == "top")
            return ScreenPosition::Top;
        if (name == "bottom")
            return ScreenPosition::Bottom;
        if (name == "center")
            return ScreenPosition::Center;
        if (name == "left")
            return ScreenPosition::Left;
        if (name == "right")
            return ScreenPosition::Right;
        return ScreenPosition::Any;
    }

    std::vector<ScoredElement> rank_elements(const std::vector<UIElement> &elements,
                                             const ElementQuery &query,
                                             const cv::Size &screen)
    {
        std::vector<ScoredElement> scored;
        for (const auto &e : elements)
        {
            if (!query.type.empty() && e.type != query.type)
                continue;
            if (e.confidence < query.min_confidence)
                continue;
            scored.push_back({e, score_of(e, query, screen)});
        }
        std::stable_sort(scored.begin(), scored.end(), [](const ScoredElement &a, const ScoredElement &b)
                         { return a.score > b.score; });
        return scored;
    }

    bool select_best_element(const std::vector<UIElement> &elements,
                             const ElementQuery &query,
                             const cv::Size &screen,
                             ScoredElement &best)
    {
        auto ranked = rank_elements(elements, query, screen);
        if (ranked.empty())
            return false;
        best = ranked.front();
        return true;
    }

} // namespace uil
