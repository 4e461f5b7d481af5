#include <gtest/gtest.h>
#include "core/Layout.hpp"
#include "core/Rect.hpp"

static void expectDisjointInside(const std::vector<Rect>& rects, Rect area) {
    for (size_t i = 0; i < rects.size(); ++i) {
        EXPECT_EQ(rects[i].intersection(area), rects[i]) << "rect " << i << " escapes area";
        for (size_t j = i + 1; j < rects.size(); ++j) {
            if (rects[i].isEmpty() || rects[j].isEmpty()) continue;
            EXPECT_FALSE(rects[i].intersects(rects[j])) << i << " overlaps " << j;
        }
    }
}

// ── Rect ────────────────────────────────────────────────────────────

TEST(RectTest, DerivedEdges) {
    Rect r(2, 3, 10, 4);
    EXPECT_EQ(r.left(), 2);
    EXPECT_EQ(r.right(), 12);
    EXPECT_EQ(r.top(), 3);
    EXPECT_EQ(r.bottom(), 7);
    EXPECT_EQ(r.area(), 40u);
    EXPECT_FALSE(r.isEmpty());
}

TEST(RectTest, ContainsIsHalfOpen) {
    Rect r(0, 0, 5, 5);
    EXPECT_TRUE(r.contains(0, 0));
    EXPECT_TRUE(r.contains(4, 4));
    EXPECT_FALSE(r.contains(5, 0));
    EXPECT_FALSE(r.contains(0, 5));
}

TEST(RectTest, IntersectionOfDisjointIsEmpty) {
    Rect a(0, 0, 5, 5);
    Rect b(5, 0, 5, 5);
    EXPECT_FALSE(a.intersects(b));
    EXPECT_TRUE(a.intersection(b).isEmpty());
    EXPECT_EQ(Rect(0, 0, 10, 10).intersection(Rect(3, 4, 20, 2)), Rect(3, 4, 7, 2));
}

TEST(RectTest, InnerCollapsesWhenMarginTooLarge) {
    EXPECT_EQ(Rect(0, 0, 10, 6).inner(1), Rect(1, 1, 8, 4));
    EXPECT_TRUE(Rect(0, 0, 3, 3).inner(2).isEmpty());
}

// ── Layout ──────────────────────────────────────────────────────────

TEST(LayoutTest, LengthAndFillSplitVertically) {
    Rect area(0, 0, 20, 10);
    auto rects = solve({Constraint::length(3), Constraint::fill()}, Direction::Vertical, 0, area);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], Rect(0, 0, 20, 3));
    EXPECT_EQ(rects[1], Rect(0, 3, 20, 7));
}

TEST(LayoutTest, PercentageIsRelativeToAxis) {
    Rect area(0, 0, 100, 5);
    auto rects = solve({Constraint::percentage(40), Constraint::fill()},
                       Direction::Horizontal, 0, area);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0].width, 40);
    EXPECT_EQ(rects[1].x, 40);
    EXPECT_EQ(rects[1].width, 60);
}

TEST(LayoutTest, FillWeightsShareRemainder) {
    Rect area(0, 0, 30, 1);
    auto rects = solve({Constraint::fill(1), Constraint::fill(2)}, Direction::Horizontal, 0, area);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0].width, 10);
    EXPECT_EQ(rects[1].width, 20);
}

TEST(LayoutTest, MarginShrinksArea) {
    Rect area(0, 0, 20, 10);
    auto rects = solve({Constraint::fill()}, Direction::Vertical, 2, area);
    ASSERT_EQ(rects.size(), 1u);
    EXPECT_EQ(rects[0], Rect(2, 2, 16, 6));
}

TEST(LayoutTest, OversizedConstraintsStayInsideArea) {
    Rect area(5, 5, 10, 10);
    auto rects = solve({Constraint::length(8), Constraint::length(8), Constraint::min(4),
                        Constraint::percentage(90)},
                       Direction::Vertical, 0, area);
    ASSERT_EQ(rects.size(), 4u);
    expectDisjointInside(rects, area);
}

TEST(LayoutTest, MixedConstraintsAreDisjoint) {
    Rect area(0, 0, 80, 24);
    auto rects = solve({Constraint::ratio(1, 4), Constraint::max(10), Constraint::min(5),
                        Constraint::fill(2), Constraint::length(7)},
                       Direction::Horizontal, 1, area);
    ASSERT_EQ(rects.size(), 5u);
    expectDisjointInside(rects, area);
}

TEST(LayoutTest, RatioWithLargeTermsDoesNotWrap) {
    Rect area(0, 0, 80, 1);
    auto rects = solve({Constraint::ratio(60000000, 100000000), Constraint::fill()},
                       Direction::Horizontal, 0, area);
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0].width, 48);
    EXPECT_EQ(rects[1].width, 32);

    rects = solve({Constraint::ratio(3000000000u, 1000000000u), Constraint::fill()},
                  Direction::Horizontal, 0, area);
    EXPECT_EQ(rects[0].width, 80);
    EXPECT_EQ(rects[1].width, 0);

    auto parsed = Constraint::parse("ratio:100000/1");
    ASSERT_TRUE(parsed.has_value());
    rects = solve({*parsed}, Direction::Horizontal, 0, Rect(0, 0, 65535, 1));
    EXPECT_EQ(rects[0].width, 65535);
}

TEST(LayoutTest, ParseConstraintSyntax) {
    EXPECT_EQ(Constraint::parse("12"), Constraint::length(12));
    EXPECT_EQ(Constraint::parse("30%"), Constraint::percentage(30));
    EXPECT_EQ(Constraint::parse("min:5"), Constraint::min(5));
    EXPECT_EQ(Constraint::parse("max:8"), Constraint::max(8));
    EXPECT_EQ(Constraint::parse("fill"), Constraint::fill());
    EXPECT_EQ(Constraint::parse("fill:3"), Constraint::fill(3));
    EXPECT_EQ(Constraint::parse("ratio:1/3"), Constraint::ratio(1, 3));
    EXPECT_FALSE(Constraint::parse("ratio:1/0").has_value());
    EXPECT_FALSE(Constraint::parse("wide").has_value());
    EXPECT_FALSE(Constraint::parse("%").has_value());
}
