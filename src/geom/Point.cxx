#include "Point.hxx"
#include "Errors.hxx"

Point::Point(const Coord& coord, double meshSize, std::optional<std::string> label)
    : Entity(Dim::Point, std::move(label)), coord_(coord), meshSize_(meshSize) {
    if (!(meshSize_ > 0.0)) throw StructuralError("Point: mesh size must be positive");
}

Point::Point(double x, double y, double meshSize, std::optional<std::string> label)
    : Point(Coord{x, y, 0.0}, meshSize, std::move(label)) {}

void Point::onConstruct(Kernel& kernel) {
    setTag(kernel.addPoint(coord_[0], coord_[1], coord_[2], meshSize_));
}
