#ifndef PLANEGEO_GMSH_KERNEL_HXX
#define PLANEGEO_GMSH_KERNEL_HXX

#include "Kernel.hxx"
#include <string>
#include <vector>

// GmshKernel: Kernel backed by the Gmsh C++ API (built-in "geo" kernel).
// Gmsh is process global; only one session may be initialized at a time,
// which Geometry enforces.
class GmshKernel : public Kernel {
public:
    struct Options {
        std::string modelName = "planegeo";
        int verbosity = 0;          // General.Verbosity
        bool terminal = false;      // General.Terminal
        bool saveAll = true;        // Mesh.SaveAll, also save elements outside physical groups
        double mshFileVersion = 0;  // Mesh.MshFileVersion, 0 keeps gmsh's default
    };

    GmshKernel() = default;
    explicit GmshKernel(const Options& opts) : opts_(opts) {}

    const Options& options() const { return opts_; }

    void sessionInit() override;
    void sessionFinalize() override;

    int addPoint(double x, double y, double z, double meshSize) override;
    int addLine(int startTag, int endTag) override;
    int addCurveLoop(const std::vector<int>& curveTags) override;
    int addPlaneSurface(const std::vector<int>& loopTags) override;

    void synchronize() override;

    void setTransfiniteCurve(int tag, int numNodes, const std::string& meshType, double coef) override;
    void setTransfiniteSurface(int tag, const std::vector<int>& cornerTags) override;
    void setRecombine(int dim, int tag) override;
    int addPhysicalGroup(int dim, const std::vector<int>& tags) override;
    void setPhysicalName(int dim, int groupTag, const std::string& name) override;

    int addField(const std::string& kind) override;
    void setFieldNumber(int tag, const std::string& key, double value) override;
    void setFieldNumbers(int tag, const std::string& key, const std::vector<double>& values) override;
    void setFieldAsBoundaryLayer(int tag) override;

    void generateMesh(int dim) override;
    Mesh importMesh() override;
    void write(const std::string& path) override;

private:
    Options opts_;
};

#endif // PLANEGEO_GMSH_KERNEL_HXX
