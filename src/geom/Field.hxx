#ifndef PLANEGEO_FIELD_HXX
#define PLANEGEO_FIELD_HXX

#include "Entity.hxx"

class CurveLoop;

// Field: mesh sizing metadata attached to (and owned by) a CurveLoop.
// Follows the same two-phase state machine as Entity, with the owning loop
// passed in so the field can read the loop's line tags.
class Field {
public:
    Field() = default;
    virtual ~Field() = default;

    Field(const Field&) = delete;
    Field& operator=(const Field&) = delete;

    void construct(Kernel& kernel, const CurveLoop& loop);
    void refine(Kernel& kernel, const CurveLoop& loop);

    EntityState state() const { return state_; }
    // Kernel field tag; set during refinement.
    const std::optional<int>& tag() const { return tag_; }

protected:
    virtual void onConstruct(Kernel& kernel, const CurveLoop& loop) { (void)kernel; (void)loop; }
    virtual void onRefine(Kernel& kernel, const CurveLoop& loop) = 0;

    void setTag(int tag) { tag_ = tag; }

private:
    std::optional<int> tag_;
    EntityState state_ = EntityState::Unsynced;
};

// BoundaryLayer: inflation layer along every curve of the owning loop.
// Attributes left unset keep the kernel's defaults.
class BoundaryLayer : public Field {
public:
    std::optional<double> anisoMax;        // fan angle threshold (AnisoMax)
    std::optional<double> hfar;            // element size far from the wall
    std::optional<double> hwallN;          // first layer size normal to the wall (hwall_n)
    std::optional<double> ratio;           // growth ratio between layers
    std::optional<double> thickness;       // maximal layer thickness
    std::optional<bool> intersectMetrics;  // IntersectMetrics
    std::optional<bool> quads;             // recombine layer cells (Quads)

protected:
    void onRefine(Kernel& kernel, const CurveLoop& loop) override;
};

#endif // PLANEGEO_FIELD_HXX
