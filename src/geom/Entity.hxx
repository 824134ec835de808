#ifndef PLANEGEO_ENTITY_HXX
#define PLANEGEO_ENTITY_HXX

#include "Kernel.hxx"
#include <optional>
#include <string>
#include <utility>

// Kernel dimension of an entity.
enum class Dim { Point = 0, Curve = 1, Surface = 2 };

inline int dimValue(Dim d) { return static_cast<int>(d); }

enum class EntityState { Unsynced, ConstructionDone, RefinementDone };

// Entity: a geometric object realized against a Kernel in two phases.
//
//   construct()  before the kernel synchronizes: dependencies first, then one
//                creation call for this entity. Repeated calls are no-ops.
//   refine()     after the kernel synchronizes: transfinite hints, physical
//                groups, fields. Throws StructuralError if the entity was never
//                constructed. Repeated calls are no-ops.
//
// Subclasses fill in onConstruct()/onRefine(). A refined variant calls its base
// hook first and then appends its own action. If a hook throws, the state does
// not advance.
class Entity {
public:
    explicit Entity(Dim dim, std::optional<std::string> label = std::nullopt)
        : dim_(dim), label_(std::move(label)) {}
    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    void construct(Kernel& kernel);
    void refine(Kernel& kernel);

    Dim dim() const { return dim_; }
    EntityState state() const { return state_; }
    const std::optional<std::string>& label() const { return label_; }

    // Kernel tag; empty until construct() has run.
    const std::optional<int>& tag() const { return tag_; }
    bool hasTag() const { return tag_.has_value(); }
    // Tag of a constructed entity; throws StructuralError otherwise.
    int requireTag() const;

protected:
    virtual void onConstruct(Kernel& kernel) = 0;
    virtual void onRefine(Kernel& kernel) { (void)kernel; }

    void setTag(int tag) { tag_ = tag; }

private:
    Dim dim_;
    std::optional<std::string> label_;
    std::optional<int> tag_;
    EntityState state_ = EntityState::Unsynced;
};

#endif // PLANEGEO_ENTITY_HXX
