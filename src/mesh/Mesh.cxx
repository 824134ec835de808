#include "Mesh.hxx"
#include <gmsh.h>
#include <unordered_map>
#include <cmath>

void Mesh::clear() {
    nv = 0;
    verts.clear(); tris.clear(); quads.clear(); bdyEdges.clear();
    triMarkers.clear(); quadMarkers.clear(); bdyMarkers.clear(); physicalNames.clear();
}

int Mesh::physicalTag(int dim, const std::string& name) const {
    for (const auto& kv : physicalNames) {
        if (kv.first.first == dim && kv.second == name) return kv.first.second;
    }
    return -1;
}

double Mesh::totalArea() const {
    double A = 0.0;
    for (const auto& t : tris)
        A += std::fabs(triArea(verts[static_cast<std::size_t>(t[0])], verts[static_cast<std::size_t>(t[1])],
                               verts[static_cast<std::size_t>(t[2])]));
    for (const auto& q : quads)
        A += std::fabs(quadArea(verts[static_cast<std::size_t>(q[0])], verts[static_cast<std::size_t>(q[1])],
                                verts[static_cast<std::size_t>(q[2])], verts[static_cast<std::size_t>(q[3])]));
    return A;
}

// gmsh element type codes
static const int kLine2 = 1;
static const int kTri3 = 2;
static const int kQuad4 = 3;

// element tag -> physical group tag, for every physical group of dimension dim
static std::unordered_map<std::size_t,int> collectMarkers(int dim, std::map<std::pair<int,int>, std::string>& names) {
    std::unordered_map<std::size_t,int> markers;
    gmsh::vectorpair groups;
    gmsh::model::getPhysicalGroups(groups, dim);
    for (const auto& g : groups) {
        std::string name;
        gmsh::model::getPhysicalName(g.first, g.second, name);
        names[{g.first, g.second}] = name;

        std::vector<int> entities;
        gmsh::model::getEntitiesForPhysicalGroup(g.first, g.second, entities);
        for (int ent : entities) {
            std::vector<int> types;
            std::vector<std::vector<std::size_t>> elemTags;
            std::vector<std::vector<std::size_t>> nodeTags;
            gmsh::model::mesh::getElements(types, elemTags, nodeTags, g.first, ent);
            for (const auto& tags : elemTags)
                for (std::size_t et : tags) markers[et] = g.second;
        }
    }
    return markers;
}

static int markerOf(const std::unordered_map<std::size_t,int>& markers, std::size_t elemTag) {
    auto it = markers.find(elemTag);
    return it == markers.end() ? -1 : it->second;
}

static Mesh buildFromGmshImpl() {
    Mesh M; M.clear();

    // Node coordinates
    std::vector<std::size_t> allNodeTags; // node tags
    std::vector<double> nodeCoord;        // xyz for each tag
    std::vector<double> nodeCoordParam;   // unused parametric coords
    gmsh::model::mesh::getNodes(allNodeTags, nodeCoord, nodeCoordParam);
    std::unordered_map<std::size_t,int> nodeTagToIndex;
    M.nv = static_cast<int>(allNodeTags.size());
    M.verts.resize(static_cast<std::size_t>(M.nv));
    for (int i = 0; i < M.nv; ++i) {
        const std::size_t k = static_cast<std::size_t>(i);
        nodeTagToIndex[allNodeTags[k]] = i;
        // nodeCoord array: (x,y,z) per node in order of allNodeTags
        M.verts[k][0] = nodeCoord[3*k];
        M.verts[k][1] = nodeCoord[3*k+1];
    }

    const auto curveMarkers = collectMarkers(1, M.physicalNames);
    const auto surfMarkers = collectMarkers(2, M.physicalNames);

    // Boundary line elements
    {
        std::vector<int> elementTypes;
        std::vector<std::vector<std::size_t>> elementTags;
        std::vector<std::vector<std::size_t>> nodeTags;
        gmsh::model::mesh::getElements(elementTypes, elementTags, nodeTags, 1);
        for (std::size_t t = 0; t < elementTypes.size(); ++t) {
            if (elementTypes[t] != kLine2) continue;
            const auto& nodes = nodeTags[t]; // flattened, 2 per element
            for (std::size_t k = 0; k < elementTags[t].size(); ++k) {
                M.bdyEdges.push_back({nodeTagToIndex[nodes[2*k]], nodeTagToIndex[nodes[2*k+1]]});
                M.bdyMarkers.push_back(markerOf(curveMarkers, elementTags[t][k]));
            }
        }
    }

    // Surface cells
    {
        std::vector<int> elementTypes;
        std::vector<std::vector<std::size_t>> elementTags;
        std::vector<std::vector<std::size_t>> nodeTags;
        gmsh::model::mesh::getElements(elementTypes, elementTags, nodeTags, 2);
        for (std::size_t t = 0; t < elementTypes.size(); ++t) {
            const auto& nodes = nodeTags[t];
            if (elementTypes[t] == kTri3) {
                for (std::size_t k = 0; k < elementTags[t].size(); ++k) {
                    M.tris.push_back({nodeTagToIndex[nodes[3*k]], nodeTagToIndex[nodes[3*k+1]],
                                      nodeTagToIndex[nodes[3*k+2]]});
                    M.triMarkers.push_back(markerOf(surfMarkers, elementTags[t][k]));
                }
            } else if (elementTypes[t] == kQuad4) {
                for (std::size_t k = 0; k < elementTags[t].size(); ++k) {
                    M.quads.push_back({nodeTagToIndex[nodes[4*k]], nodeTagToIndex[nodes[4*k+1]],
                                       nodeTagToIndex[nodes[4*k+2]], nodeTagToIndex[nodes[4*k+3]]});
                    M.quadMarkers.push_back(markerOf(surfMarkers, elementTags[t][k]));
                }
            }
        }
    }

    return M;
}

Mesh Mesh::buildFromGmshCurrent() {
    return buildFromGmshImpl();
}
