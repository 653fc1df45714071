#include <DSMesh/DS2DContoursTriangulation.h>
#include <DSMesh/DSContour.h>
#include <DSMesh/DSGTest.h>
#include <algorithm>

namespace DS
{

namespace
{

double trianglesArea( const Contour2d& points, const Triangulation& tris )
{
    double area = 0;
    for ( const auto& t : tris )
        area += cross( points[t[1]] - points[t[0]], points[t[2]] - points[t[0]] ) / 2;
    return area;
}

Contour2d treePoints( const ContourTree& tree )
{
    Contour2d res;
    for ( const auto& c : tree.contours )
        res.insert( res.end(), c.begin(), c.end() );
    return res;
}

} //anonymous namespace

TEST( DSMesh, TriangulateSquareWithHole )
{
    const auto outer = makeRoundedRectContour( 10, 10, 0 );
    const auto hole = makeRoundedRectContour( 4, 4, 0 );

    auto tris = PlanarTriangulation::triangulateRegion( outer, { hole } );
    ASSERT_TRUE( tris.has_value() ) << tris.error();
    // polygon with holes: n + h + 2 * holes - 2 triangles
    EXPECT_EQ( tris->size(), 8u );

    Contour2d points = outer;
    points.insert( points.end(), hole.begin(), hole.end() );
    EXPECT_NEAR( trianglesArea( points, *tris ), 100.0 - 16.0, 1e-9 );
    for ( const auto& t : *tris )
        EXPECT_GT( cross( points[t[1]] - points[t[0]], points[t[2]] - points[t[0]] ), 0 );
}

TEST( DSMesh, TriangulateConcave )
{
    // letter L
    Contour2d l = {
        { 0, 0 },
        { 3, 0 },
        { 3, 1 },
        { 1, 1 },
        { 1, 4 },
        { 0, 4 }
    };
    // orientation of the input is not important
    std::reverse( l.begin(), l.end() );
    auto tris = PlanarTriangulation::triangulateRegion( l, {} );
    ASSERT_TRUE( tris.has_value() );
    EXPECT_EQ( tris->size(), 4u );
    EXPECT_NEAR( trianglesArea( l, *tris ), 6.0, 1e-9 );
}

TEST( DSMesh, TriangulateSeveralHoles )
{
    const auto outer = makeRoundedRectContour( 30, 10, 2 );
    Contours2d holes;
    for ( double x : { -10.0, 0.0, 10.0 } )
    {
        auto h = makeRoundedRectContour( 4, 4, 1 );
        for ( auto& p : h )
            p.x += x;
        holes.push_back( std::move( h ) );
    }
    auto tris = PlanarTriangulation::triangulateRegion( outer, holes );
    ASSERT_TRUE( tris.has_value() );

    Contour2d points = outer;
    double expected = calcOrientedArea( outer );
    for ( const auto& h : holes )
    {
        points.insert( points.end(), h.begin(), h.end() );
        expected -= calcOrientedArea( h );
    }
    EXPECT_NEAR( trianglesArea( points, *tris ), expected, 1e-9 );
}

TEST( DSMesh, ContourTree )
{
    // plate, letter O outline and its counter, and a separate glyph
    Contours2d cs = {
        makeRoundedRectContour( 4, 4, 0 ),
        makeRoundedRectContour( 100, 25, 2 ),
        makeRoundedRectContour( 8, 8, 0 ),
        makeRoundedRectContour( 2, 2, 0 )
    };
    for ( auto& p : cs[3] )
        p.x += 20;

    const auto tree = PlanarTriangulation::buildContourTree( cs );
    ASSERT_EQ( tree.size(), 4u );
    EXPECT_EQ( tree.depth[0], 2 );
    EXPECT_EQ( tree.depth[1], 0 );
    EXPECT_EQ( tree.depth[2], 1 );
    EXPECT_EQ( tree.depth[3], 1 );
    EXPECT_EQ( tree.parent[0], 2 );
    EXPECT_EQ( tree.parent[1], -1 );
    EXPECT_EQ( tree.parent[2], 1 );
    EXPECT_EQ( tree.parent[3], 1 );
    EXPECT_TRUE( tree.isMaterial( 0 ) );
    EXPECT_FALSE( tree.isMaterial( 3 ) );
    EXPECT_EQ( tree.children( 1 ).size(), 2u );

    // even depth is counter-clockwise, odd depth is clockwise
    EXPECT_GT( calcOrientedArea( tree.contours[0] ), 0 );
    EXPECT_GT( calcOrientedArea( tree.contours[1] ), 0 );
    EXPECT_LT( calcOrientedArea( tree.contours[2] ), 0 );
    EXPECT_LT( calcOrientedArea( tree.contours[3] ), 0 );

    const double plateArea = calcOrientedArea( cs[1] );
    const double material = plateArea - 64 + 16 - 4;
    EXPECT_NEAR( tree.materialArea(), material, 1e-9 );

    auto tris = PlanarTriangulation::triangulateRegions( tree, 0 );
    ASSERT_TRUE( tris.has_value() );
    EXPECT_NEAR( trianglesArea( treePoints( tree ), *tris ), material, 1e-9 );

    auto holeTris = PlanarTriangulation::triangulateRegions( tree, 1 );
    ASSERT_TRUE( holeTris.has_value() );
    EXPECT_NEAR( trianglesArea( treePoints( tree ), *holeTris ), 64 - 16 + 4, 1e-9 );
}

TEST( DSMesh, FindIntersectingContours )
{
    Contours2d cs = {
        makeRoundedRectContour( 10, 10, 0 ),
        makeRoundedRectContour( 4, 4, 0 )
    };
    EXPECT_FALSE( PlanarTriangulation::findIntersectingContours( cs ).has_value() );

    auto shifted = makeRoundedRectContour( 4, 4, 0 );
    for ( auto& p : shifted )
        p.x += 1;
    cs.push_back( shifted );
    auto crossing = PlanarTriangulation::findIntersectingContours( cs );
    ASSERT_TRUE( crossing.has_value() );
    EXPECT_EQ( crossing->first, 1 );
    EXPECT_EQ( crossing->second, 2 );
}

TEST( DSMesh, OutlineOfOverlappingContours )
{
    auto square = [] ( double x, double y, double size )
    {
        auto c = makeRoundedRectContour( size, size, 0 );
        for ( auto& p : c )
            p += Vector2d{ x, y };
        return c;
    };

    auto merged = PlanarTriangulation::getOutline( { square( 0, 0, 4 ), square( 2, 2, 4 ) } );
    ASSERT_EQ( merged.size(), 1u );
    EXPECT_EQ( merged[0].size(), 8u );
    EXPECT_NEAR( calcOrientedArea( merged[0] ), 28.0, 1e-9 );

    // contours sharing an edge
    merged = PlanarTriangulation::getOutline( { square( 0, 0, 2 ), square( 2, 0, 2 ) } );
    ASSERT_EQ( merged.size(), 1u );
    EXPECT_EQ( merged[0].size(), 4u );
    EXPECT_NEAR( calcOrientedArea( merged[0] ), 8.0, 1e-9 );

    // contours touching at a corner stay separate
    merged = PlanarTriangulation::getOutline( { square( 0, 0, 2 ), square( 2, 2, 2 ) } );
    ASSERT_EQ( merged.size(), 2u );
    EXPECT_NEAR( calcOrientedArea( merged[0] ), 4.0, 1e-9 );
    EXPECT_NEAR( calcOrientedArea( merged[1] ), 4.0, 1e-9 );

    // clockwise contour is inner part only for negative winding
    auto cw = square( 0, 0, 4 );
    std::reverse( cw.begin(), cw.end() );
    EXPECT_TRUE( PlanarTriangulation::getOutline( { cw }, { .innerType = PlanarTriangulation::WindingMode::Positive } ).empty() );
    merged = PlanarTriangulation::getOutline( { cw }, { .innerType = PlanarTriangulation::WindingMode::Negative } );
    ASSERT_EQ( merged.size(), 1u );
    EXPECT_NEAR( calcOrientedArea( merged[0] ), 16.0, 1e-9 );
}

TEST( DSMesh, OutlineOfLetterWithBar )
{
    // letter O crossed by vertical bar, like a cedilla crossing its letter
    auto hole = makeRoundedRectContour( 4, 4, 0 );
    std::reverse( hole.begin(), hole.end() );
    const Contour2d bar = { { -1, -6 }, { 1, -6 }, { 1, 6 }, { -1, 6 } };
    const Contours2d letter = { makeRoundedRectContour( 10, 10, 0 ), hole, bar };
    EXPECT_TRUE( PlanarTriangulation::findIntersectingContours( letter ).has_value() );

    const auto outline = PlanarTriangulation::getOutline( letter );
    ASSERT_EQ( outline.size(), 3u );
    EXPECT_FALSE( PlanarTriangulation::findIntersectingContours( outline ).has_value() );
    int numHoles = 0;
    double area = 0;
    for ( const auto& c : outline )
    {
        const double a = calcOrientedArea( c );
        if ( a < 0 )
        {
            ++numHoles;
            EXPECT_NEAR( a, -4.0, 1e-9 );
        }
        area += a;
    }
    EXPECT_EQ( numHoles, 2 );
    EXPECT_NEAR( area, 100.0 - 16.0 + 8.0 + 4.0, 1e-9 );

    const auto tree = PlanarTriangulation::buildContourTree( outline );
    EXPECT_NEAR( tree.materialArea(), area, 1e-9 );
    auto tris = PlanarTriangulation::triangulateRegions( tree, 0 );
    ASSERT_TRUE( tris.has_value() ) << tris.error();
    EXPECT_NEAR( trianglesArea( treePoints( tree ), *tris ), area, 1e-9 );
}

} //namespace DS
