#include "Geometry.hxx"
#include "GmshKernel.hxx"
#include "PlaneSurface.hxx"
#include "Polygon.hxx"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// Channel [0,4]x[0,1] with a circular obstacle approximated by a polygon and a
// boundary layer around it.
static std::vector<std::shared_ptr<Entity>> buildChannel(double h) {
    PolygonSpec outer;
    outer.coords = planarCoords({{0.0, 0.0}, {4.0, 0.0}, {4.0, 1.0}, {0.0, 1.0}});
    outer.meshSizes = {h};
    outer.labels = {"wall", "outlet", "wall", "inlet"};
    auto channel = makePolygon(outer).makeLoop();

    const double pi = std::acos(-1.0);
    const int nseg = 24;
    const double r = 0.15, cx = 1.0, cy = 0.5;
    PolygonSpec hole;
    for (int i = 0; i < nseg; ++i) {
        const double a = 2.0 * pi * i / nseg;
        hole.coords.push_back({cx + r * std::cos(a), cy + r * std::sin(a), 0.0});
    }
    hole.meshSizes = {0.25 * h};
    hole.labels = {"obstacle"};
    auto obstacle = makePolygon(hole).makeLoop();

    auto bl = std::make_unique<BoundaryLayer>();
    bl->hwallN = 0.005;
    bl->ratio = 1.2;
    bl->thickness = 0.05;
    bl->quads = true;
    obstacle->addField(std::move(bl));

    auto fluid = std::make_shared<PlaneSurface>(channel, std::vector<std::shared_ptr<CurveLoop>>{obstacle}, "fluid");
    return {fluid};
}

// Unit square meshed as a structured quad grid.
static std::vector<std::shared_ptr<Entity>> buildTransfiniteSquare(double h) {
    const int cells = std::max(1, static_cast<int>(std::lround(1.0 / h)));
    PolygonSpec sq;
    sq.coords = planarCoords({{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}});
    sq.meshSizes = {h};
    sq.labels = {"wall", "", "wall", ""};
    sq.cellCounts = {cells};
    Polygon poly = makePolygon(sq);
    auto surf = std::make_shared<TransfiniteSurface>(poly.makeLoop(), poly.points,
                                                     std::vector<std::shared_ptr<CurveLoop>>{}, "domain", true);
    return {surf};
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 4) {
        std::fprintf(stderr, "Usage: %s <out.msh> [h] [--transfinite]\n", argv[0]);
        return 2;
    }
    const std::string mshPath = argv[1];
    double h = 0.1;
    bool transfinite = false;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--transfinite") == 0) transfinite = true;
        else h = std::atof(argv[i]);
    }
    if (!(h > 0.0)) {
        std::fprintf(stderr, "Invalid mesh size: %g\n", h);
        return 2;
    }

    try {
        auto roots = transfinite ? buildTransfiniteSquare(h) : buildChannel(h);

        GmshKernel::Options kopts;
        kopts.modelName = transfinite ? "square" : "channel";
        kopts.mshFileVersion = 2.2;
        GmshKernel kernel(kopts);

        GeometryOptions gopts;
        gopts.verbose = true;
        Geometry geo(kernel, gopts);
        geo.open();
        Mesh M = geo.generate(roots);
        geo.write(mshPath);
        std::printf("Wrote mesh: %s (%d vertices, %d triangles, %d quads, area %.6f)\n",
                    mshPath.c_str(), M.nv, M.ntris(), M.nquads(), M.totalArea());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Mesh generation failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
