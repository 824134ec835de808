#ifndef PLANEGEO_KERNEL_HXX
#define PLANEGEO_KERNEL_HXX

#include "Mesh.hxx"
#include <string>
#include <vector>

// Kernel: the capability surface the entity graph needs from a geometry/meshing
// engine. Creation calls return the tag the kernel assigned.
//
// Creation calls belong before synchronize(); transfinite, recombine, physical
// group and field calls belong after it. Implementations report failures by
// throwing KernelError.
class Kernel {
public:
    virtual ~Kernel() = default;

    // Session
    virtual void sessionInit() = 0;
    virtual void sessionFinalize() = 0;

    // Construction phase
    virtual int addPoint(double x, double y, double z, double meshSize) = 0;
    virtual int addLine(int startTag, int endTag) = 0;
    virtual int addCurveLoop(const std::vector<int>& curveTags) = 0;
    virtual int addPlaneSurface(const std::vector<int>& loopTags) = 0;

    virtual void synchronize() = 0;

    // Refinement phase
    virtual void setTransfiniteCurve(int tag, int numNodes, const std::string& meshType, double coef) = 0;
    virtual void setTransfiniteSurface(int tag, const std::vector<int>& cornerTags) = 0;
    virtual void setRecombine(int dim, int tag) = 0;
    virtual int addPhysicalGroup(int dim, const std::vector<int>& tags) = 0;
    virtual void setPhysicalName(int dim, int groupTag, const std::string& name) = 0;

    // Mesh size fields
    virtual int addField(const std::string& kind) = 0;
    virtual void setFieldNumber(int tag, const std::string& key, double value) = 0;
    virtual void setFieldNumbers(int tag, const std::string& key, const std::vector<double>& values) = 0;
    virtual void setFieldAsBoundaryLayer(int tag) = 0;

    // Output
    virtual void generateMesh(int dim) = 0;
    virtual Mesh importMesh() = 0;
    virtual void write(const std::string& path) = 0;
};

#endif // PLANEGEO_KERNEL_HXX
