#include "Line.hxx"
#include "Errors.hxx"

Line::Line(std::shared_ptr<Point> start, std::shared_ptr<Point> end, std::optional<std::string> label)
    : Entity(Dim::Curve, std::move(label)), start_(std::move(start)), end_(std::move(end)) {
    if (!start_ || !end_) throw StructuralError("Line: start and end points are required");
}

void Line::onConstruct(Kernel& kernel) {
    start_->construct(kernel);
    end_->construct(kernel);
    setTag(kernel.addLine(start_->requireTag(), end_->requireTag()));
}

const char* gradingName(Grading g) {
    switch (g) {
    case Grading::Progression: return "Progression";
    case Grading::Bump: return "Bump";
    case Grading::Beta: return "Beta";
    }
    return "Progression";
}

TransfiniteLine::TransfiniteLine(std::shared_ptr<Point> start, std::shared_ptr<Point> end,
                                 int cellCount, Grading grading, double coef,
                                 std::optional<std::string> label)
    : Line(std::move(start), std::move(end), std::move(label)),
      cellCount_(cellCount), grading_(grading), coef_(coef) {
    if (cellCount_ < 1) throw StructuralError("TransfiniteLine: cell count must be >= 1");
}

void TransfiniteLine::onRefine(Kernel& kernel) {
    Line::onRefine(kernel);
    kernel.setTransfiniteCurve(requireTag(), numNodes(), gradingName(grading_), coef_);
}
