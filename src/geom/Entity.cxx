#include "Entity.hxx"
#include "Errors.hxx"

void Entity::construct(Kernel& kernel) {
    if (state_ != EntityState::Unsynced) return;
    onConstruct(kernel);
    state_ = EntityState::ConstructionDone;
}

void Entity::refine(Kernel& kernel) {
    if (state_ == EntityState::RefinementDone) return;
    if (state_ == EntityState::Unsynced)
        throw StructuralError("refine() called on an entity that was never constructed");
    onRefine(kernel);
    state_ = EntityState::RefinementDone;
}

int Entity::requireTag() const {
    if (!tag_) throw StructuralError("entity has no kernel tag; construct() it first");
    return *tag_;
}
