#include "Polygon.hxx"
#include "Errors.hxx"

#include <string>

namespace {
template <typename T>
static const T& pick(const std::vector<T>& v, std::size_t i, const char* what, std::size_t n) {
    if (v.size() == 1) return v[0];
    if (v.size() != n)
        throw StructuralError(std::string("Polygon: '") + what + "' needs 1 or " + std::to_string(n) +
                              " values, got " + std::to_string(v.size()));
    return v[i];
}
}

Polygon makePolygon(const PolygonSpec& spec) {
    const std::size_t n = spec.coords.size();
    if (n < 2) throw StructuralError("Polygon: at least 2 vertices are required");
    if (spec.meshSizes.empty()) throw StructuralError("Polygon: mesh size is required");

    Polygon poly;
    poly.points.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        poly.points.push_back(std::make_shared<Point>(spec.coords[i], pick(spec.meshSizes, i, "meshSizes", n)));
    }

    poly.lines.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = poly.points[i];
        const auto& b = poly.points[(i + 1) % n];

        std::optional<std::string> label;
        if (!spec.labels.empty()) {
            const std::string& s = pick(spec.labels, i, "labels", n);
            if (!s.empty()) label = s;
        }

        if (spec.cellCounts.empty()) {
            poly.lines.push_back(std::make_shared<Line>(a, b, label));
        } else {
            const int cells = pick(spec.cellCounts, i, "cellCounts", n);
            const Grading g = spec.gradings.empty() ? Grading::Progression : pick(spec.gradings, i, "gradings", n);
            const double c = spec.coefs.empty() ? 1.0 : pick(spec.coefs, i, "coefs", n);
            poly.lines.push_back(std::make_shared<TransfiniteLine>(a, b, cells, g, c, label));
        }
    }
    return poly;
}

std::shared_ptr<CurveLoop> Polygon::makeLoop() const {
    return std::make_shared<CurveLoop>(lines);
}

std::vector<std::array<double, 3>> planarCoords(const std::vector<std::array<double, 2>>& xy) {
    std::vector<std::array<double, 3>> out;
    out.reserve(xy.size());
    for (const auto& p : xy) out.push_back({p[0], p[1], 0.0});
    return out;
}
