// Picking the element an automation layer should tap.
#include <gtest/gtest.h>

#include <vector>

#include "uil/element_ranker.hpp"

namespace
{
    const cv::Size kScreen(1000, 1000);

    uil::UIElement el(int x, int y, int w, int h, const char *type, double conf)
    {
        return uil::make_element(x, y, w, h, type, conf, 4);
    }
}

TEST(ElementRanker, ColorButtonsRankFirst)
{
    std::vector<uil::UIElement> els = {
        el(100, 100, 100, 50, "rectangle", 0.8),
        el(400, 400, 100, 50, "color_button_green", 0.8),
        el(700, 700, 100, 50, "polygon", 0.6),
    };
    auto ranked = uil::rank_elements(els, {}, kScreen);

    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].element.type, "color_button_green");
    EXPECT_NEAR(ranked[0].score, 0.8 + 0.2 + 0.1, 1e-9);
    EXPECT_EQ(ranked[1].element.type, "rectangle");
    EXPECT_NEAR(ranked[1].score, 0.8 + 0.1 + 0.1, 1e-9);
    EXPECT_NEAR(ranked[2].score, 0.6 + 0.1, 1e-9);
}

TEST(ElementRanker, FiltersByTypeAndConfidence)
{
    std::vector<uil::UIElement> els = {
        el(0, 0, 100, 50, "rectangle", 0.8),
        el(0, 200, 100, 50, "circle", 0.9),
        el(0, 400, 100, 50, "unknown", 0.5),
    };
    uil::ElementQuery q;
    q.type = "circle";
    auto ranked = uil::rank_elements(els, q, kScreen);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].element.type, "circle");

    q.type.clear();
    EXPECT_EQ(uil::rank_elements(els, q, kScreen).size(), 2u); // unknown is below 0.6

    q.min_confidence = 0.95;
    uil::ScoredElement best;
    EXPECT_FALSE(uil::select_best_element(els, q, kScreen, best));
}

TEST(ElementRanker, PositionPreferenceBreaksTies)
{
    std::vector<uil::UIElement> els = {
        el(450, 100, 100, 50, "rectangle", 0.8), // top
        el(450, 850, 100, 50, "rectangle", 0.8), // bottom
    };
    uil::ElementQuery q;
    uil::ScoredElement best;

    q.position = uil::ScreenPosition::Bottom;
    ASSERT_TRUE(uil::select_best_element(els, q, kScreen, best));
    EXPECT_EQ(best.element.y, 850);

    q.position = uil::parse_screen_position("top");
    ASSERT_TRUE(uil::select_best_element(els, q, kScreen, best));
    EXPECT_EQ(best.element.y, 100);
}

TEST(ElementRanker, HugeElementsGetNoSizeBonus)
{
    std::vector<uil::UIElement> els = {el(0, 0, 800, 800, "rectangle", 0.8)};
    auto ranked = uil::rank_elements(els, {}, kScreen);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_NEAR(ranked[0].score, 0.9, 1e-9);
}

TEST(ElementRanker, ParsesPositions)
{
    EXPECT_EQ(uil::parse_screen_position("left"), uil::ScreenPosition::Left);
    EXPECT_EQ(uil::parse_screen_position("right"), uil::ScreenPosition::Right);
    EXPECT_EQ(uil::parse_screen_position("center"), uil::ScreenPosition::Center);
    EXPECT_EQ(uil::parse_screen_position("middle"), uil::ScreenPosition::Any);
}
