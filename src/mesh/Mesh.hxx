#ifndef PLANEGEO_MESH_HXX
#define PLANEGEO_MESH_HXX

#include <vector>
#include <array>
#include <map>
#include <string>
#include <utility>
#include <cstddef>

// Mesh: 2D cells produced by the kernel, with physical group markers.
// All members are public for direct access; helper static inline functions provided.
class Mesh {
public:
    // Counts
    int nv = 0;            // number of vertices

    // Geometry and topology
    std::vector<std::array<double,2>> verts;        // vertex coordinates
    std::vector<std::array<int,3>>    tris;         // triangle to vertex indices
    std::vector<std::array<int,4>>    quads;        // quadrilateral to vertex indices
    std::vector<std::array<int,2>>    bdyEdges;     // 2-node line elements on curves

    // Physical group tag of each cell / edge, -1 when not in any group
    std::vector<int> triMarkers;
    std::vector<int> quadMarkers;
    std::vector<int> bdyMarkers;

    // (dim, physical group tag) -> name
    std::map<std::pair<int,int>, std::string> physicalNames;

    int ntris() const { return static_cast<int>(tris.size()); }
    int nquads() const { return static_cast<int>(quads.size()); }

    // Physical group tag with the given name and dimension, -1 if absent.
    int physicalTag(int dim, const std::string& name) const;

    // Sum of all cell areas.
    double totalArea() const;

    // Build from current gmsh model (model should be synchronized and 2D mesh generated)
    static Mesh buildFromGmshCurrent();

    static inline double triArea(const std::array<double,2>& a,
                                 const std::array<double,2>& b,
                                 const std::array<double,2>& c) {
        return 0.5 * ((b[0]-a[0])*(c[1]-a[1]) - (b[1]-a[1])*(c[0]-a[0]));
    }

    // Shoelace area of a (possibly non-convex) quad a-b-c-d
    static inline double quadArea(const std::array<double,2>& a,
                                  const std::array<double,2>& b,
                                  const std::array<double,2>& c,
                                  const std::array<double,2>& d) {
        return triArea(a, b, c) + triArea(a, c, d);
    }

    // Clear all data
    void clear();
};

#endif // PLANEGEO_MESH_HXX
