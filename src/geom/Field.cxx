#include "Field.hxx"
#include "CurveLoop.hxx"
#include "Errors.hxx"

void Field::construct(Kernel& kernel, const CurveLoop& loop) {
    if (state_ != EntityState::Unsynced) return;
    onConstruct(kernel, loop);
    state_ = EntityState::ConstructionDone;
}

void Field::refine(Kernel& kernel, const CurveLoop& loop) {
    if (state_ == EntityState::RefinementDone) return;
    if (state_ == EntityState::Unsynced)
        throw StructuralError("refine() called on a field that was never constructed");
    onRefine(kernel, loop);
    state_ = EntityState::RefinementDone;
}

void BoundaryLayer::onRefine(Kernel& kernel, const CurveLoop& loop) {
    const int f = kernel.addField("BoundaryLayer");
    setTag(f);

    std::vector<double> curves;
    curves.reserve(loop.lineTags().size());
    for (int t : loop.lineTags()) curves.push_back(static_cast<double>(t));
    kernel.setFieldNumbers(f, "CurvesList", curves);

    if (anisoMax) kernel.setFieldNumber(f, "AnisoMax", *anisoMax);
    if (intersectMetrics) kernel.setFieldNumber(f, "IntersectMetrics", *intersectMetrics ? 1.0 : 0.0);
    if (quads) kernel.setFieldNumber(f, "Quads", *quads ? 1.0 : 0.0);
    if (hfar) kernel.setFieldNumber(f, "hfar", *hfar);
    if (hwallN) kernel.setFieldNumber(f, "hwall_n", *hwallN);
    if (ratio) kernel.setFieldNumber(f, "ratio", *ratio);
    if (thickness) kernel.setFieldNumber(f, "thickness", *thickness);

    kernel.setFieldAsBoundaryLayer(f);
}
