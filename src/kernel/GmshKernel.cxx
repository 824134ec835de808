#include "GmshKernel.hxx"
#include "Errors.hxx"
#include <gmsh.h>

#include <exception>
#include <string>
#include <utility>

namespace {
// Run a gmsh call, reporting any failure as KernelError with gmsh's message.
template <typename F>
static auto gmshCall(const char* what, F&& f) -> decltype(f()) {
    try {
        return f();
    } catch (const KernelError&) {
        throw;
    } catch (const std::exception& e) {
        throw KernelError(std::string("gmsh ") + what + ": " + e.what());
    }
}
}

void GmshKernel::sessionInit() {
    gmshCall("initialize", [&] {
        gmsh::initialize();
        gmsh::option::setNumber("General.Terminal", opts_.terminal ? 1 : 0);
        gmsh::option::setNumber("General.Verbosity", opts_.verbosity);
        gmsh::model::add(opts_.modelName);
    });
}

void GmshKernel::sessionFinalize() {
    gmshCall("finalize", [] { gmsh::finalize(); });
}

int GmshKernel::addPoint(double x, double y, double z, double meshSize) {
    return gmshCall("addPoint", [&] { return gmsh::model::geo::addPoint(x, y, z, meshSize); });
}

int GmshKernel::addLine(int startTag, int endTag) {
    return gmshCall("addLine", [&] { return gmsh::model::geo::addLine(startTag, endTag); });
}

int GmshKernel::addCurveLoop(const std::vector<int>& curveTags) {
    return gmshCall("addCurveLoop", [&] { return gmsh::model::geo::addCurveLoop(curveTags); });
}

int GmshKernel::addPlaneSurface(const std::vector<int>& loopTags) {
    return gmshCall("addPlaneSurface", [&] { return gmsh::model::geo::addPlaneSurface(loopTags); });
}

void GmshKernel::synchronize() {
    gmshCall("synchronize", [] { gmsh::model::geo::synchronize(); });
}

void GmshKernel::setTransfiniteCurve(int tag, int numNodes, const std::string& meshType, double coef) {
    gmshCall("setTransfiniteCurve", [&] { gmsh::model::mesh::setTransfiniteCurve(tag, numNodes, meshType, coef); });
}

void GmshKernel::setTransfiniteSurface(int tag, const std::vector<int>& cornerTags) {
    gmshCall("setTransfiniteSurface", [&] { gmsh::model::mesh::setTransfiniteSurface(tag, "Left", cornerTags); });
}

void GmshKernel::setRecombine(int dim, int tag) {
    gmshCall("setRecombine", [&] { gmsh::model::mesh::setRecombine(dim, tag); });
}

int GmshKernel::addPhysicalGroup(int dim, const std::vector<int>& tags) {
    return gmshCall("addPhysicalGroup", [&] { return gmsh::model::addPhysicalGroup(dim, tags); });
}

void GmshKernel::setPhysicalName(int dim, int groupTag, const std::string& name) {
    gmshCall("setPhysicalName", [&] { gmsh::model::setPhysicalName(dim, groupTag, name); });
}

int GmshKernel::addField(const std::string& kind) {
    return gmshCall("field::add", [&] { return gmsh::model::mesh::field::add(kind); });
}

void GmshKernel::setFieldNumber(int tag, const std::string& key, double value) {
    gmshCall("field::setNumber", [&] { gmsh::model::mesh::field::setNumber(tag, key, value); });
}

void GmshKernel::setFieldNumbers(int tag, const std::string& key, const std::vector<double>& values) {
    gmshCall("field::setNumbers", [&] { gmsh::model::mesh::field::setNumbers(tag, key, values); });
}

void GmshKernel::setFieldAsBoundaryLayer(int tag) {
    gmshCall("field::setAsBoundaryLayer", [&] { gmsh::model::mesh::field::setAsBoundaryLayer(tag); });
}

void GmshKernel::generateMesh(int dim) {
    gmshCall("generate", [&] {
        gmsh::model::mesh::generate(dim);
        gmsh::option::setNumber("Mesh.SaveAll", opts_.saveAll ? 1 : 0);
    });
}

Mesh GmshKernel::importMesh() {
    return gmshCall("importMesh", [] { return Mesh::buildFromGmshCurrent(); });
}

void GmshKernel::write(const std::string& path) {
    gmshCall("write", [&] {
        if (opts_.mshFileVersion > 0) gmsh::option::setNumber("Mesh.MshFileVersion", opts_.mshFileVersion);
        gmsh::write(path);
    });
}
