#pragma once

#include "DSMeshFwd.h"
#include "DSExpected.h"
#include "DSTriMesh.h"

namespace DS
{

/// builds closed solid from planar regions of the contour tree:
/// root contours are extruded from zBottom to zTop, all nested contours from zFloor to zTop;
/// if zFloor > zBottom then the regions inside root contours are pockets with the floor at zFloor,
/// otherwise they are through holes
[[nodiscard]] DSMESH_API Expected<TriMesh> makeLayerSolid( const ContourTree& tree, float zBottom, float zFloor, float zTop );

} //namespace DS
