#ifndef PLANEGEO_PLANE_SURFACE_HXX
#define PLANEGEO_PLANE_SURFACE_HXX

#include "CurveLoop.hxx"
#include <memory>
#include <vector>

// PlaneSurface: planar region bounded by an outer loop with optional holes.
class PlaneSurface : public Entity {
public:
    PlaneSurface(std::shared_ptr<CurveLoop> outer,
                 std::vector<std::shared_ptr<CurveLoop>> holes = {},
                 std::optional<std::string> label = std::nullopt,
                 bool recombine = false);

    const std::shared_ptr<CurveLoop>& outer() const { return loops_.front(); }
    // Outer loop followed by the holes.
    const std::vector<std::shared_ptr<CurveLoop>>& curveLoops() const { return loops_; }
    // Request quadrilateral cells (recombination) for this surface.
    bool recombine() const { return recombine_; }

protected:
    void onConstruct(Kernel& kernel) override;
    void onRefine(Kernel& kernel) override;

private:
    std::vector<std::shared_ptr<CurveLoop>> loops_;
    bool recombine_;
};

// TransfiniteSurface: structured (mapped) meshing of a 3 or 4 sided surface.
// Every corner must be a point of the outer loop. Whether the corner count fits
// the loop topology is checked by the kernel.
class TransfiniteSurface : public PlaneSurface {
public:
    TransfiniteSurface(std::shared_ptr<CurveLoop> outer,
                       std::vector<std::shared_ptr<Point>> corners,
                       std::vector<std::shared_ptr<CurveLoop>> holes = {},
                       std::optional<std::string> label = std::nullopt,
                       bool recombine = false);

    const std::vector<std::shared_ptr<Point>>& corners() const { return corners_; }

protected:
    void onRefine(Kernel& kernel) override;

private:
    std::vector<std::shared_ptr<Point>> corners_;
};

#endif // PLANEGEO_PLANE_SURFACE_HXX
