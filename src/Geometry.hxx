#ifndef PLANEGEO_GEOMETRY_HXX
#define PLANEGEO_GEOMETRY_HXX

#include "Entity.hxx"
#include "Kernel.hxx"
#include "Mesh.hxx"
#include <memory>
#include <string>
#include <vector>

struct GeometryOptions {
    int meshDimension = 2;   // passed to the kernel's mesh generator
    bool verbose = false;    // one line per phase on stderr
};

// Geometry: one kernel session, Unopened -> Open -> Closed.
//
// Only one Geometry may be open per process. generate() realizes an entity
// graph: construct() over every root, a single synchronize(), refine() over
// every root, then mesh generation. If generate() or write() throws, the
// session is closed before the exception propagates. The destructor closes.
class Geometry {
public:
    enum class State { Unopened, Open, Closed };

    explicit Geometry(Kernel& kernel, const GeometryOptions& opts = GeometryOptions());
    ~Geometry();

    Geometry(const Geometry&) = delete;
    Geometry& operator=(const Geometry&) = delete;

    // Throws LifecycleError if this or another Geometry is already open, or if
    // this one was closed.
    void open();
    void close();

    State state() const { return state_; }
    bool isOpen() const { return state_ == State::Open; }

    // Roots are processed in the given order in both phases.
    //
    // Entities record their own lifecycle state and keep it after the session
    // ends, so a graph is realized at most once: passing already constructed or
    // refined entities to a later session creates nothing for them in that
    // session's kernel. Build a fresh graph for every session.
    Mesh generate(const std::vector<std::shared_ptr<Entity>>& roots);
    Mesh generate(const std::shared_ptr<Entity>& root);

    // Export through the kernel; the format follows the file extension.
    void write(const std::string& path);

private:
    void requireOpen(const char* op) const;
    void closeAfterFailure();
    Mesh runPhases(const std::vector<std::shared_ptr<Entity>>& roots);

    Kernel& kernel_;
    GeometryOptions opts_;
    State state_ = State::Unopened;

    static bool sessionLive_;
};

#endif // PLANEGEO_GEOMETRY_HXX
