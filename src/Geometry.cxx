#include "Geometry.hxx"
#include "Errors.hxx"

#include <cstdio>
#include <exception>

bool Geometry::sessionLive_ = false;

Geometry::Geometry(Kernel& kernel, const GeometryOptions& opts)
    : kernel_(kernel), opts_(opts) {}

Geometry::~Geometry() {
    if (state_ == State::Open) closeAfterFailure();
}

void Geometry::open() {
    if (state_ == State::Open) throw LifecycleError("Geometry: session is already open");
    if (state_ == State::Closed) throw LifecycleError("Geometry: session was closed and cannot be reopened");
    if (sessionLive_) throw LifecycleError("Geometry: another kernel session is already open");
    kernel_.sessionInit();
    sessionLive_ = true;
    state_ = State::Open;
}

void Geometry::close() {
    if (state_ != State::Open) {
        if (state_ == State::Unopened) state_ = State::Closed;
        return;
    }
    // Mark closed first so a failing finalize still releases the guard.
    state_ = State::Closed;
    sessionLive_ = false;
    kernel_.sessionFinalize();
}

// Called from a catch block: the caller's exception must survive, so a
// finalize failure is only reported.
void Geometry::closeAfterFailure() {
    try {
        close();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Geometry: kernel finalize failed: %s\n", e.what());
    }
}

void Geometry::requireOpen(const char* op) const {
    if (state_ != State::Open)
        throw LifecycleError(std::string("Geometry: ") + op + "() requires an open session");
}

Mesh Geometry::generate(const std::shared_ptr<Entity>& root) {
    return generate(std::vector<std::shared_ptr<Entity>>{root});
}

Mesh Geometry::generate(const std::vector<std::shared_ptr<Entity>>& roots) {
    requireOpen("generate");
    try {
        return runPhases(roots);
    } catch (...) {
        closeAfterFailure();
        throw;
    }
}

Mesh Geometry::runPhases(const std::vector<std::shared_ptr<Entity>>& roots) {
    for (const auto& r : roots) {
        if (!r) throw StructuralError("Geometry: null root entity");
    }
    for (const auto& r : roots) r->construct(kernel_);
    if (opts_.verbose) std::fprintf(stderr, "Geometry: constructed %zu root(s)\n", roots.size());

    kernel_.synchronize();

    for (const auto& r : roots) r->refine(kernel_);
    if (opts_.verbose) std::fprintf(stderr, "Geometry: refined %zu root(s)\n", roots.size());

    kernel_.generateMesh(opts_.meshDimension);
    Mesh M = kernel_.importMesh();
    if (opts_.verbose)
        std::fprintf(stderr, "Geometry: mesh has %d vertices, %d triangles, %d quads\n",
                     M.nv, M.ntris(), M.nquads());
    return M;
}

void Geometry::write(const std::string& path) {
    requireOpen("write");
    try {
        kernel_.write(path);
    } catch (...) {
        closeAfterFailure();
        throw;
    }
}
