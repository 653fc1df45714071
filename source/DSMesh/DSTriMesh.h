#pragma once

#include "DSMeshFwd.h"
#include "DSVector3.h"
#include "DSBox.h"

namespace DS
{

/// very simple structure for storing mesh of triangles only,
/// without easy navigation between neighbor elements
struct [[nodiscard]] TriMesh
{
    Triangulation tris;
    std::vector<Vector3f> points;

    [[nodiscard]] size_t numTris() const { return tris.size(); }

    /// appends all triangles and points of other mesh
    DSMESH_API void addMesh( const TriMesh& other );

    /// returns the box of all points
    [[nodiscard]] DSMESH_API Box3f computeBoundingBox() const;

    /// returns signed volume, positive for closed mesh with outward normals
    [[nodiscard]] DSMESH_API double volume() const;

    /// returns total area of all triangles
    [[nodiscard]] DSMESH_API double area() const;

    /// returns true if each directed edge has exactly one oppositely directed edge in another triangle
    [[nodiscard]] DSMESH_API bool isClosed() const;
};

} //namespace DS
