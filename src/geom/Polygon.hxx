#ifndef PLANEGEO_POLYGON_HXX
#define PLANEGEO_POLYGON_HXX

#include "CurveLoop.hxx"
#include <array>
#include <memory>
#include <string>
#include <vector>

// Description of a closed polygon. Vertices are joined in order and the last
// vertex is joined back to the first.
//
// Per-vertex / per-edge lists hold either a single value (applied everywhere)
// or exactly one value per vertex / edge; the number of edges equals the number
// of vertices. Empty optional lists take the defaults below.
struct PolygonSpec {
    std::vector<std::array<double, 3>> coords;
    std::vector<double> meshSizes;          // required, per vertex
    std::vector<std::string> labels;        // per edge, "" = unlabeled
    std::vector<int> cellCounts;            // per edge; non-empty makes transfinite edges
    std::vector<Grading> gradings;          // per edge, default Progression
    std::vector<double> coefs;              // per edge, default 1.0
};

struct Polygon {
    std::vector<std::shared_ptr<Point>> points;
    std::vector<std::shared_ptr<Line>> lines;

    std::shared_ptr<CurveLoop> makeLoop() const;
};

// Throws StructuralError for fewer than 2 vertices or a list of the wrong length.
Polygon makePolygon(const PolygonSpec& spec);

// 2D convenience: z = 0.
std::vector<std::array<double, 3>> planarCoords(const std::vector<std::array<double, 2>>& xy);

#endif // PLANEGEO_POLYGON_HXX
