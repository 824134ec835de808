#ifndef PLANEGEO_ERRORS_HXX
#define PLANEGEO_ERRORS_HXX

#include <stdexcept>
#include <string>

// Caller bug in the entity graph: an open curve loop, a transfinite corner
// outside its loop, refine() issued before construct(), bad parameters.
class StructuralError : public std::logic_error {
public:
    explicit StructuralError(const std::string& what) : std::logic_error(what) {}
};

// Failure reported by the meshing kernel. Message is the kernel's own.
class KernelError : public std::runtime_error {
public:
    explicit KernelError(const std::string& what) : std::runtime_error(what) {}
};

// Geometry session used outside the Open state, or opened twice.
class LifecycleError : public std::logic_error {
public:
    explicit LifecycleError(const std::string& what) : std::logic_error(what) {}
};

#endif // PLANEGEO_ERRORS_HXX
