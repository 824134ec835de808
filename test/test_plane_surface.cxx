#include <gtest/gtest.h>
#include "PlaneSurface.hxx"
#include "Polygon.hxx"
#include "RecordingKernel.hxx"

#include <memory>
#include <vector>

namespace {
Polygon square(double x0, double y0, double s, const std::string& label = "") {
    PolygonSpec spec;
    spec.coords = planarCoords({{x0, y0}, {x0 + s, y0}, {x0 + s, y0 + s}, {x0, y0 + s}});
    spec.meshSizes = {0.1};
    if (!label.empty()) spec.labels = {label};
    return makePolygon(spec);
}
}

TEST(PlaneSurface, OuterThenHolesThenSurface) {
    RecordingKernel k;
    auto outer = square(0, 0, 4).makeLoop();
    auto hole1 = square(1, 1, 0.5).makeLoop();
    auto hole2 = square(2, 2, 0.5).makeLoop();
    PlaneSurface s(outer, {hole1, hole2});
    ASSERT_EQ(s.curveLoops().size(), 3u);
    EXPECT_EQ(s.outer(), outer);

    s.construct(k);
    EXPECT_EQ(k.count("addPoint"), 12);
    EXPECT_EQ(k.count("addLine"), 12);
    EXPECT_EQ(k.count("addCurveLoop"), 3);
    EXPECT_EQ(k.count("addPlaneSurface"), 1);
    EXPECT_EQ(outer->requireTag(), 1);
    EXPECT_EQ(hole1->requireTag(), 2);
    EXPECT_EQ(hole2->requireTag(), 3);
    EXPECT_EQ(k.calls.back(), "addPlaneSurface");
}

TEST(PlaneSurface, LabelAndRecombine) {
    RecordingKernel k;
    PlaneSurface s(square(0, 0, 1).makeLoop(), {}, std::string("domain"), true);
    s.construct(k);
    s.refine(k);
    s.refine(k);

    ASSERT_EQ(k.groups.size(), 1u);
    EXPECT_EQ(k.groups[0].dim, 2);
    EXPECT_EQ(k.groups[0].name, "domain");
    EXPECT_EQ(k.groups[0].tags, std::vector<int>{s.requireTag()});
    ASSERT_EQ(k.recombines.size(), 1u);
    EXPECT_EQ(k.recombines[0], std::make_pair(2, s.requireTag()));
}

TEST(PlaneSurface, PlainSurfaceRefineOnlyRefinesLoops) {
    RecordingKernel k;
    PlaneSurface s(square(0, 0, 1).makeLoop());
    s.construct(k);
    const auto before = k.calls.size();
    s.refine(k);
    EXPECT_EQ(k.calls.size(), before);
    EXPECT_EQ(s.state(), EntityState::RefinementDone);
    EXPECT_EQ(s.outer()->state(), EntityState::RefinementDone);
}

TEST(PlaneSurface, EmptyLabelIsUnlabeled) {
    RecordingKernel k;
    PlaneSurface s(square(0, 0, 1).makeLoop(), {}, std::string(""));
    s.construct(k);
    s.refine(k);
    EXPECT_EQ(k.count("addPhysicalGroup"), 0);
    EXPECT_EQ(k.count("setPhysicalName"), 0);
}

TEST(PlaneSurface, RefinesEveryLoop) {
    RecordingKernel k;
    auto outer = square(0, 0, 4, "outer").makeLoop();
    auto hole = square(1, 1, 1, "hole").makeLoop();
    PlaneSurface s(outer, {hole});
    s.construct(k);
    s.refine(k);
    ASSERT_NE(k.group("outer"), nullptr);
    ASSERT_NE(k.group("hole"), nullptr);
    EXPECT_EQ(k.group("outer")->tags.size(), 4u);
    EXPECT_EQ(hole->state(), EntityState::RefinementDone);
}

TEST(PlaneSurface, RequiresOuterLoop) {
    EXPECT_THROW(PlaneSurface(nullptr), StructuralError);
}

TEST(TransfiniteSurface, CornerTagsAfterBaseRefine) {
    RecordingKernel k;
    Polygon poly = square(0, 0, 1);
    TransfiniteSurface s(poly.makeLoop(), poly.points, {}, std::string("domain"), true);
    s.construct(k);
    s.refine(k);

    ASSERT_EQ(k.transfiniteSurfaces.size(), 1u);
    EXPECT_EQ(k.transfiniteSurfaces[0].first, s.requireTag());
    std::vector<int> corners;
    for (const auto& p : poly.points) corners.push_back(p->requireTag());
    EXPECT_EQ(k.transfiniteSurfaces[0].second, corners);
    EXPECT_LT(k.firstIndex("setRecombine"), k.firstIndex("setTransfiniteSurface"));
    EXPECT_LT(k.firstIndex("addPhysicalGroup"), k.firstIndex("setTransfiniteSurface"));
}

TEST(TransfiniteSurface, ForeignCornerIsStructuralError) {
    Polygon poly = square(0, 0, 1);
    std::vector<std::shared_ptr<Point>> corners = poly.points;
    corners[2] = std::make_shared<Point>(1.0, 1.0, 0.1);
    EXPECT_THROW(TransfiniteSurface(poly.makeLoop(), corners), StructuralError);
}

TEST(TransfiniteSurface, ThreeCornersAccepted) {
    Polygon poly = square(0, 0, 1);
    std::vector<std::shared_ptr<Point>> corners{poly.points[0], poly.points[1], poly.points[2]};
    EXPECT_NO_THROW(TransfiniteSurface(poly.makeLoop(), corners));
}
