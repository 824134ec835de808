#include <gtest/gtest.h>
#include "CurveLoop.hxx"
#include "Polygon.hxx"
#include "RecordingKernel.hxx"

#include <memory>

namespace {
std::shared_ptr<CurveLoop> triangle() {
    PolygonSpec spec;
    spec.coords = planarCoords({{0, 0}, {1, 0}, {0, 1}});
    spec.meshSizes = {0.1};
    return makePolygon(spec).makeLoop();
}
}

TEST(BoundaryLayer, OnlyProvidedAttributesAreSet) {
    RecordingKernel k;
    auto loop = triangle();
    auto bl = std::make_unique<BoundaryLayer>();
    bl->hwallN = 0.01;
    bl->ratio = 1.1;
    bl->quads = true;
    loop->addField(std::move(bl));

    loop->construct(k);
    EXPECT_EQ(k.count("addField"), 0);
    loop->refine(k);

    EXPECT_EQ(k.count("addField"), 1);
    EXPECT_EQ(k.fieldNumbers.size(), 3u);
    EXPECT_DOUBLE_EQ(k.fieldNumbers.at("hwall_n"), 0.01);
    EXPECT_DOUBLE_EQ(k.fieldNumbers.at("ratio"), 1.1);
    EXPECT_DOUBLE_EQ(k.fieldNumbers.at("Quads"), 1.0);
    EXPECT_EQ(k.fieldNumbers.count("thickness"), 0u);
    EXPECT_EQ(k.fieldNumbers.count("hfar"), 0u);
    EXPECT_EQ(k.fieldNumbers.count("AnisoMax"), 0u);
    EXPECT_EQ(k.fieldNumbers.count("IntersectMetrics"), 0u);
}

TEST(BoundaryLayer, ExplicitFalseIsStillSent) {
    RecordingKernel k;
    auto loop = triangle();
    auto bl = std::make_unique<BoundaryLayer>();
    bl->intersectMetrics = false;
    loop->addField(std::move(bl));
    loop->construct(k);
    loop->refine(k);
    ASSERT_EQ(k.fieldNumbers.count("IntersectMetrics"), 1u);
    EXPECT_DOUBLE_EQ(k.fieldNumbers.at("IntersectMetrics"), 0.0);
}

TEST(BoundaryLayer, CoversLoopCurvesAndBecomesActive) {
    RecordingKernel k;
    auto loop = triangle();
    Field& f = loop->addField(std::make_unique<BoundaryLayer>());
    loop->construct(k);
    loop->refine(k);

    ASSERT_TRUE(f.tag().has_value());
    EXPECT_EQ(k.boundaryLayerField, *f.tag());
    ASSERT_EQ(k.curvesList.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i)
        EXPECT_DOUBLE_EQ(k.curvesList[i], static_cast<double>(loop->lineTags()[i]));
    // field set up after the loop's own refinement, activated last
    EXPECT_EQ(k.calls.back(), "setFieldAsBoundaryLayer");
    EXPECT_EQ(f.state(), EntityState::RefinementDone);
}

TEST(BoundaryLayer, RefineBeforeConstructIsIllegal) {
    RecordingKernel k;
    auto loop = triangle();
    BoundaryLayer bl;
    EXPECT_THROW(bl.refine(k, *loop), StructuralError);
    bl.construct(k, *loop);
    EXPECT_TRUE(k.calls.empty());
}

TEST(BoundaryLayer, OneFieldPerLoopRefinement) {
    RecordingKernel k;
    auto loop = triangle();
    loop->addField(std::make_unique<BoundaryLayer>());
    loop->addField(std::make_unique<BoundaryLayer>());
    loop->construct(k);
    loop->refine(k);
    loop->refine(k);
    EXPECT_EQ(k.count("addField"), 2);
    EXPECT_EQ(k.count("setFieldAsBoundaryLayer"), 2);
}
