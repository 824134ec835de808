#ifndef PLANEGEO_RECORDING_KERNEL_HXX
#define PLANEGEO_RECORDING_KERNEL_HXX

#include "Kernel.hxx"
#include "Errors.hxx"
#include <map>
#include <string>
#include <utility>
#include <vector>

// Kernel double for tests: hands out sequential tags per kind and records
// every call as a short string in `calls`.
class RecordingKernel : public Kernel {
public:
    struct TransfiniteCurve { int tag; int numNodes; std::string meshType; double coef; };
    struct PhysicalGroup { int dim; std::vector<int> tags; int groupTag; std::string name; };

    std::vector<std::string> calls;
    std::map<std::string, int> counts;

    std::vector<TransfiniteCurve> transfiniteCurves;
    std::vector<std::pair<int, std::vector<int>>> transfiniteSurfaces;
    std::vector<std::pair<int,int>> recombines;
    std::vector<PhysicalGroup> groups;
    std::map<std::string, double> fieldNumbers;
    std::vector<double> curvesList;
    int boundaryLayerField = -1;
    bool synchronized = false;
    int meshDim = -1;
    std::string written;

    // When set, the named call throws KernelError.
    std::string failOn;
    // When true, sessionFinalize() throws KernelError("finalize failed").
    bool failFinalize = false;

    int count(const std::string& what) const {
        auto it = counts.find(what);
        return it == counts.end() ? 0 : it->second;
    }

    // Index of the first recorded call starting with prefix, -1 if none.
    int firstIndex(const std::string& prefix) const {
        for (std::size_t i = 0; i < calls.size(); ++i)
            if (calls[i].compare(0, prefix.size(), prefix) == 0) return static_cast<int>(i);
        return -1;
    }
    int lastIndex(const std::string& prefix) const {
        for (std::size_t i = calls.size(); i > 0; --i)
            if (calls[i-1].compare(0, prefix.size(), prefix) == 0) return static_cast<int>(i-1);
        return -1;
    }

    const PhysicalGroup* group(const std::string& name) const {
        for (const auto& g : groups) if (g.name == name) return &g;
        return nullptr;
    }

    void sessionInit() override { record("sessionInit"); }
    void sessionFinalize() override {
        if (failFinalize) throw KernelError("finalize failed");
        record("sessionFinalize");
    }

    int addPoint(double, double, double, double) override { return next("addPoint"); }
    int addLine(int a, int b) override {
        return next("addLine", std::to_string(a) + "," + std::to_string(b));
    }
    int addCurveLoop(const std::vector<int>&) override { return next("addCurveLoop"); }
    int addPlaneSurface(const std::vector<int>&) override { return next("addPlaneSurface"); }

    void synchronize() override { record("synchronize"); synchronized = true; }

    void setTransfiniteCurve(int tag, int numNodes, const std::string& meshType, double coef) override {
        record("setTransfiniteCurve", std::to_string(tag));
        transfiniteCurves.push_back({tag, numNodes, meshType, coef});
    }
    void setTransfiniteSurface(int tag, const std::vector<int>& cornerTags) override {
        record("setTransfiniteSurface", std::to_string(tag));
        transfiniteSurfaces.emplace_back(tag, cornerTags);
    }
    void setRecombine(int dim, int tag) override {
        record("setRecombine", std::to_string(tag));
        recombines.emplace_back(dim, tag);
    }
    int addPhysicalGroup(int dim, const std::vector<int>& tags) override {
        const int g = next("addPhysicalGroup");
        groups.push_back({dim, tags, g, ""});
        return g;
    }
    void setPhysicalName(int dim, int groupTag, const std::string& name) override {
        record("setPhysicalName", name);
        for (auto& g : groups) if (g.dim == dim && g.groupTag == groupTag) g.name = name;
    }

    int addField(const std::string& kind) override { return next("addField", kind); }
    void setFieldNumber(int, const std::string& key, double value) override {
        record("setFieldNumber", key);
        fieldNumbers[key] = value;
    }
    void setFieldNumbers(int, const std::string& key, const std::vector<double>& values) override {
        record("setFieldNumbers", key);
        if (key == "CurvesList") curvesList = values;
    }
    void setFieldAsBoundaryLayer(int tag) override {
        record("setFieldAsBoundaryLayer");
        boundaryLayerField = tag;
    }

    void generateMesh(int dim) override { record("generateMesh"); meshDim = dim; }
    Mesh importMesh() override { record("importMesh"); return Mesh(); }
    void write(const std::string& path) override { record("write"); written = path; }

private:
    void record(const std::string& what, const std::string& detail = "") {
        if (!failOn.empty() && what == failOn) throw KernelError(what + " failed");
        calls.push_back(detail.empty() ? what : what + " " + detail);
        ++counts[what];
    }
    int next(const std::string& what, const std::string& detail = "") {
        record(what, detail);
        return ++tags_[what];
    }

    std::map<std::string, int> tags_;
};

#endif // PLANEGEO_RECORDING_KERNEL_HXX
