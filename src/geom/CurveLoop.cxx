#include "CurveLoop.hxx"
#include "Errors.hxx"

#include <string>
#include <utility>

CurveLoop::CurveLoop(std::vector<std::shared_ptr<Line>> lines)
    : Entity(Dim::Curve), lines_(std::move(lines)) {
    const std::size_t n = lines_.size();
    if (n == 0) throw StructuralError("CurveLoop: a loop needs at least one line");
    for (std::size_t i = 0; i < n; ++i) {
        if (!lines_[i]) throw StructuralError("CurveLoop: null line at position " + std::to_string(i));
    }
    // Tail of each line must be the head of the next, wrapping around.
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t j = (i + 1) % n;
        if (lines_[i]->end() != lines_[j]->start()) {
            throw StructuralError("CurveLoop: line " + std::to_string(i) +
                                  " does not end where line " + std::to_string(j) + " starts");
        }
    }
}

Field& CurveLoop::addField(std::unique_ptr<Field> field) {
    if (!field) throw StructuralError("CurveLoop: null field");
    if (state() != EntityState::Unsynced)
        throw StructuralError("CurveLoop: fields must be attached before construction");
    fields_.push_back(std::move(field));
    return *fields_.back();
}

std::vector<std::shared_ptr<Point>> CurveLoop::points() const {
    std::vector<std::shared_ptr<Point>> pts;
    pts.reserve(lines_.size());
    for (const auto& l : lines_) pts.push_back(l->start());
    return pts;
}

bool CurveLoop::containsPoint(const Point& p) const {
    for (const auto& l : lines_) {
        if (l->start().get() == &p) return true;
    }
    return false;
}

void CurveLoop::onConstruct(Kernel& kernel) {
    std::vector<int> tags;
    tags.reserve(lines_.size());
    for (const auto& l : lines_) {
        l->construct(kernel);
        tags.push_back(l->requireTag());
    }
    setTag(kernel.addCurveLoop(tags));
    lineTags_ = std::move(tags);
    for (auto& f : fields_) f->construct(kernel, *this);
}

void CurveLoop::onRefine(Kernel& kernel) {
    // label -> member tags, in the order labels first appear
    std::vector<std::pair<std::string, std::vector<int>>> groups;
    for (const auto& l : lines_) {
        if (l->label() && !l->label()->empty()) {
            const std::string& name = *l->label();
            auto it = groups.begin();
            while (it != groups.end() && it->first != name) ++it;
            if (it == groups.end()) {
                groups.emplace_back(name, std::vector<int>{});
                it = groups.end() - 1;
            }
            it->second.push_back(l->requireTag());
        }
        l->refine(kernel);
    }

    const int curveDim = dimValue(Dim::Curve);
    for (const auto& g : groups) {
        const int group = kernel.addPhysicalGroup(curveDim, g.second);
        kernel.setPhysicalName(curveDim, group, g.first);
    }

    for (auto& f : fields_) f->refine(kernel, *this);
}
