#ifndef PLANEGEO_LINE_HXX
#define PLANEGEO_LINE_HXX

#include "Point.hxx"
#include <memory>

// Line: directed straight curve between two shared points.
// The label is not applied here; the owning CurveLoop groups lines by label
// into named physical groups during refinement.
class Line : public Entity {
public:
    Line(std::shared_ptr<Point> start, std::shared_ptr<Point> end,
         std::optional<std::string> label = std::nullopt);

    const std::shared_ptr<Point>& start() const { return start_; }
    const std::shared_ptr<Point>& end() const { return end_; }

protected:
    void onConstruct(Kernel& kernel) override;

private:
    std::shared_ptr<Point> start_;
    std::shared_ptr<Point> end_;
};

// Node distribution along a transfinite curve.
enum class Grading { Progression, Bump, Beta };

// Kernel spelling of a grading ("Progression", "Bump", "Beta").
const char* gradingName(Grading g);

// TransfiniteLine: a Line meshed with a fixed number of cells.
// After the base refinement it constrains the curve to cellCount + 1 nodes.
class TransfiniteLine : public Line {
public:
    TransfiniteLine(std::shared_ptr<Point> start, std::shared_ptr<Point> end,
                    int cellCount,
                    Grading grading = Grading::Progression,
                    double coef = 1.0,
                    std::optional<std::string> label = std::nullopt);

    int cellCount() const { return cellCount_; }
    int numNodes() const { return cellCount_ + 1; }
    Grading grading() const { return grading_; }
    double coef() const { return coef_; }

protected:
    void onRefine(Kernel& kernel) override;

private:
    int cellCount_;
    Grading grading_;
    double coef_;
};

#endif // PLANEGEO_LINE_HXX
