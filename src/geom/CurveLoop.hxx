#ifndef PLANEGEO_CURVE_LOOP_HXX
#define PLANEGEO_CURVE_LOOP_HXX

#include "Line.hxx"
#include "Field.hxx"
#include <memory>
#include <vector>

// CurveLoop: ordered closed cycle of lines.
// The end point of lines[i] must be the same Point instance as the start point of
// lines[(i+1) % n]; the constructor throws StructuralError otherwise.
//
// Refinement groups the loop's labeled lines into one named physical curve group
// per label (first-seen order), then refines the attached fields.
class CurveLoop : public Entity {
public:
    explicit CurveLoop(std::vector<std::shared_ptr<Line>> lines);

    // Takes ownership of the field. Fields must be attached before construct().
    Field& addField(std::unique_ptr<Field> field);

    const std::vector<std::shared_ptr<Line>>& lines() const { return lines_; }
    const std::vector<std::unique_ptr<Field>>& fields() const { return fields_; }

    // Vertex sequence in traversal order (start point of each line).
    std::vector<std::shared_ptr<Point>> points() const;
    bool containsPoint(const Point& p) const;

    // Line tags in loop order; filled by construct().
    const std::vector<int>& lineTags() const { return lineTags_; }

protected:
    void onConstruct(Kernel& kernel) override;
    void onRefine(Kernel& kernel) override;

private:
    std::vector<std::shared_ptr<Line>> lines_;
    std::vector<std::unique_ptr<Field>> fields_;
    std::vector<int> lineTags_;
};

#endif // PLANEGEO_CURVE_LOOP_HXX
