#include "DSLayeredExtrusion.h"
#include "DS2DContoursTriangulation.h"
#include "DSTimer.h"

namespace DS
{

Expected<TriMesh> makeLayerSolid( const ContourTree& tree, float zBottom, float zFloor, float zTop )
{
    DS_TIMER;
    if ( tree.size() == 0 )
        return unexpected( "No contours to extrude" );
    if ( !( zTop > zBottom ) || zFloor < zBottom || !( zFloor < zTop ) )
        return unexpected( "Invalid layer heights" );

    const bool pockets = zFloor > zBottom;
    const int numPoints = tree.numPoints();
    // each contour point gets two vertices: lower (id 2*v) and upper (id 2*v+1)
    auto lower = [] ( int v ) { return 2 * v; };
    auto upper = [] ( int v ) { return 2 * v + 1; };

    TriMesh res;
    res.points.resize( 2 * numPoints );
    for ( int c = 0; c < int( tree.size() ); ++c )
    {
        const float zLow = tree.parent[c] < 0 ? zBottom : zFloor;
        const auto& cont = tree.contours[c];
        for ( int i = 0; i < int( cont.size() ); ++i )
        {
            const int v = tree.firstVert[c] + i;
            const Vector2f p{ cont[i] };
            res.points[lower( v )] = Vector3f( p, zLow );
            res.points[upper( v )] = Vector3f( p, zTop );
        }
    }

    // side walls, contours are oriented so that material is on the left
    for ( int c = 0; c < int( tree.size() ); ++c )
    {
        const int n = int( tree.contours[c].size() );
        for ( int i = 0; i < n; ++i )
        {
            const int a = tree.firstVert[c] + i;
            const int b = tree.firstVert[c] + ( i + 1 ) % n;
            res.tris.push_back( { lower( a ), lower( b ), upper( b ) } );
            res.tris.push_back( { lower( a ), upper( b ), upper( a ) } );
        }
    }

    // top cap over material regions
    auto topTris = PlanarTriangulation::triangulateRegions( tree, 0 );
    if ( !topTris )
        return unexpected( std::move( topTris.error() ) );
    for ( const auto& t : *topTris )
        res.tris.push_back( { upper( t[0] ), upper( t[1] ), upper( t[2] ) } );

    if ( !pockets )
    {
        for ( const auto& t : *topTris )
            res.tris.push_back( { lower( t[0] ), lower( t[2] ), lower( t[1] ) } );
        return res;
    }

    // full bottom cap under root contours
    ContourTree roots;
    roots.firstVert.push_back( 0 );
    std::vector<int> rootIds;
    for ( int c = 0; c < int( tree.size() ); ++c )
    {
        if ( tree.parent[c] >= 0 )
            continue;
        rootIds.push_back( c );
        roots.contours.push_back( tree.contours[c] );
        roots.parent.push_back( -1 );
        roots.depth.push_back( 0 );
        roots.firstVert.push_back( roots.firstVert.back() + int( tree.contours[c].size() ) );
    }
    auto bottomTris = PlanarTriangulation::triangulateRegions( roots, 0 );
    if ( !bottomTris )
        return unexpected( std::move( bottomTris.error() ) );
    auto toTreeVert = [&] ( int v )
    {
        int r = 0;
        while ( roots.firstVert[r + 1] <= v )
            ++r;
        return tree.firstVert[rootIds[r]] + v - roots.firstVert[r];
    };
    for ( const auto& t : *bottomTris )
        res.tris.push_back( { lower( toTreeVert( t[0] ) ), lower( toTreeVert( t[2] ) ), lower( toTreeVert( t[1] ) ) } );

    // pocket floors looking up
    auto floorTris = PlanarTriangulation::triangulateRegions( tree, 1 );
    if ( !floorTris )
        return unexpected( std::move( floorTris.error() ) );
    for ( const auto& t : *floorTris )
        res.tris.push_back( { lower( t[0] ), lower( t[1] ), lower( t[2] ) } );

    return res;
}

} //namespace DS
