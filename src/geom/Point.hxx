#ifndef PLANEGEO_POINT_HXX
#define PLANEGEO_POINT_HXX

#include "Entity.hxx"
#include <array>

// Point: zero-dimensional leaf of the entity graph.
// Two points with equal coordinates are still distinct entities; share the
// same shared_ptr<Point> between lines to share a vertex.
class Point : public Entity {
public:
    using Coord = std::array<double, 3>;

    // meshSize: target element size near the point, must be > 0.
    Point(const Coord& coord, double meshSize, std::optional<std::string> label = std::nullopt);
    Point(double x, double y, double meshSize, std::optional<std::string> label = std::nullopt);

    const Coord& coord() const { return coord_; }
    double x() const { return coord_[0]; }
    double y() const { return coord_[1]; }
    double z() const { return coord_[2]; }
    double meshSize() const { return meshSize_; }

protected:
    void onConstruct(Kernel& kernel) override;

private:
    const Coord coord_;
    const double meshSize_;
};

#endif // PLANEGEO_POINT_HXX
