#include "PlaneSurface.hxx"
#include "Errors.hxx"

#include <string>
#include <utility>

PlaneSurface::PlaneSurface(std::shared_ptr<CurveLoop> outer,
                           std::vector<std::shared_ptr<CurveLoop>> holes,
                           std::optional<std::string> label,
                           bool recombine)
    : Entity(Dim::Surface, std::move(label)), recombine_(recombine) {
    if (!outer) throw StructuralError("PlaneSurface: outer loop is required");
    loops_.reserve(holes.size() + 1);
    loops_.push_back(std::move(outer));
    for (auto& h : holes) {
        if (!h) throw StructuralError("PlaneSurface: null hole loop");
        loops_.push_back(std::move(h));
    }
}

void PlaneSurface::onConstruct(Kernel& kernel) {
    std::vector<int> loopTags;
    loopTags.reserve(loops_.size());
    for (const auto& cl : loops_) {
        cl->construct(kernel);
        loopTags.push_back(cl->requireTag());
    }
    setTag(kernel.addPlaneSurface(loopTags));
}

void PlaneSurface::onRefine(Kernel& kernel) {
    for (const auto& cl : loops_) cl->refine(kernel);

    const int surfDim = dimValue(Dim::Surface);
    if (label() && !label()->empty()) {
        const int group = kernel.addPhysicalGroup(surfDim, {requireTag()});
        kernel.setPhysicalName(surfDim, group, *label());
    }
    if (recombine_) kernel.setRecombine(surfDim, requireTag());
}

TransfiniteSurface::TransfiniteSurface(std::shared_ptr<CurveLoop> outer,
                                       std::vector<std::shared_ptr<Point>> corners,
                                       std::vector<std::shared_ptr<CurveLoop>> holes,
                                       std::optional<std::string> label,
                                       bool recombine)
    : PlaneSurface(std::move(outer), std::move(holes), std::move(label), recombine),
      corners_(std::move(corners)) {
    for (std::size_t i = 0; i < corners_.size(); ++i) {
        if (!corners_[i] || !this->outer()->containsPoint(*corners_[i]))
            throw StructuralError("TransfiniteSurface: corner " + std::to_string(i) +
                                  " is not a point of the outer loop");
    }
}

void TransfiniteSurface::onRefine(Kernel& kernel) {
    PlaneSurface::onRefine(kernel);
    std::vector<int> cornerTags;
    cornerTags.reserve(corners_.size());
    for (const auto& c : corners_) cornerTags.push_back(c->requireTag());
    kernel.setTransfiniteSurface(requireTag(), cornerTags);
}
