#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include <optional>
#include <utility>

namespace DS
{

/// closed contours with their nesting;
/// contours of even depth bound material from outside, contours of odd depth bound holes
struct ContourTree
{
    Contours2d contours;
    /// parent[i] is the smallest contour enclosing contour i, or -1 for root contours
    std::vector<int> parent;
    /// number of contours enclosing contour i
    std::vector<int> depth;
    /// firstVert[i] is the global id of the first point of contour i, firstVert.back() is the total number of points
    std::vector<int> firstVert;

    [[nodiscard]] size_t size() const { return contours.size(); }
    [[nodiscard]] bool isMaterial( int c ) const { return depth[c] % 2 == 0; }
    [[nodiscard]] int numPoints() const { return firstVert.empty() ? 0 : firstVert.back(); }
    [[nodiscard]] DSMESH_API std::vector<int> children( int c ) const;
    /// area of material regions: counter-clockwise areas minus clockwise ones
    [[nodiscard]] DSMESH_API double materialArea() const;
};

namespace PlanarTriangulation
{

/// Specify mode of detecting inside and outside parts of the outline
enum class WindingMode
{
    NonZero,
    Positive,
    Negative
};

struct OutlineParameters
{
    WindingMode innerType{ WindingMode::NonZero }; ///< what to mark as inner part
};

/// returns the boundary of the region covered by given closed contours:
/// crossing and overlapping contours are split at their intersections and merged,
/// the result has counter-clockwise outer contours and clockwise holes, distinct contours may only touch at vertices
[[nodiscard]] DSMESH_API Contours2d getOutline( const Contours2d& contours, const OutlineParameters& params = {} );

/// returns the first found pair of different contours with crossing edges
[[nodiscard]] DSMESH_API std::optional<std::pair<int, int>> findIntersectingContours( const Contours2d& contours );

/// computes nesting of non-intersecting contours, drops degenerate ones,
/// and orients even-depth contours counter-clockwise and odd-depth contours clockwise
[[nodiscard]] DSMESH_API ContourTree buildContourTree( Contours2d contours );

/// triangulates the region bounded by outer contour and holes inside it by ear clipping, holes are bridged to the outer boundary;
/// orientation of the input contours is not important;
/// returns counter-clockwise triangles with ids in concatenation of outer points and all hole points
[[nodiscard]] DSMESH_API Expected<Triangulation> triangulateRegion( const Contour2d& outer, const Contours2d& holes );

/// triangulates all regions of the tree which outer contour has given depth parity (0 - material, 1 - holes);
/// returns counter-clockwise triangles with global point ids of the tree
[[nodiscard]] DSMESH_API Expected<Triangulation> triangulateRegions( const ContourTree& tree, int depthParity );

} //namespace PlanarTriangulation

} //namespace DS
