#include <DSMesh/DSLayeredExtrusion.h>
#include <DSMesh/DS2DContoursTriangulation.h>
#include <DSMesh/DSContour.h>
#include <DSMesh/DSGTest.h>

namespace DS
{

namespace
{

ContourTree squareWithHole()
{
    return PlanarTriangulation::buildContourTree( {
        makeRoundedRectContour( 10, 10, 0 ),
        makeRoundedRectContour( 4, 4, 0 )
    } );
}

} //anonymous namespace

TEST( DSMesh, LayerSolidPlate )
{
    const auto tree = PlanarTriangulation::buildContourTree( { makeRoundedRectContour( 100, 25, 2 ) } );
    auto plate = makeLayerSolid( tree, 0, 0, 1.5f );
    ASSERT_TRUE( plate.has_value() ) << plate.error();
    EXPECT_TRUE( plate->isClosed() );
    EXPECT_NEAR( plate->volume(), calcOrientedArea( tree.contours[0] ) * 1.5, 0.05 );

    const auto box = plate->computeBoundingBox();
    EXPECT_NEAR( box.min.z, 0, 1e-6 );
    EXPECT_NEAR( box.max.z, 1.5, 1e-6 );
    EXPECT_NEAR( box.size().x, 100, 1e-4 );
}

TEST( DSMesh, LayerSolidThroughHole )
{
    auto solid = makeLayerSolid( squareWithHole(), 1, 1, 2 );
    ASSERT_TRUE( solid.has_value() ) << solid.error();
    EXPECT_TRUE( solid->isClosed() );
    EXPECT_NEAR( solid->volume(), 84.0, 1e-4 );
    // outer and hole walls, top and bottom caps
    EXPECT_EQ( solid->numTris(), size_t( 8 + 8 + 2 * 8 ) );
}

TEST( DSMesh, LayerSolidPocket )
{
    auto solid = makeLayerSolid( squareWithHole(), 0, 0.5f, 1 );
    ASSERT_TRUE( solid.has_value() ) << solid.error();
    EXPECT_TRUE( solid->isClosed() );
    EXPECT_NEAR( solid->volume(), 100.0 - 16.0 * 0.5, 1e-4 );
    EXPECT_NEAR( solid->area(), 2 * 100.0 + 40.0 * 1 + 16.0 * 0.5, 1e-4 );
}

TEST( DSMesh, LayerSolidIsland )
{
    // counter of a glyph stays as a pillar inside the pocket
    const auto tree = PlanarTriangulation::buildContourTree( {
        makeRoundedRectContour( 20, 20, 0 ),
        makeRoundedRectContour( 10, 10, 0 ),
        makeRoundedRectContour( 4, 4, 0 )
    } );
    auto combined = makeLayerSolid( tree, 0, 1, 2 );
    ASSERT_TRUE( combined.has_value() ) << combined.error();
    EXPECT_TRUE( combined->isClosed() );
    EXPECT_NEAR( combined->volume(), 400.0 * 2 - ( 100.0 - 16.0 ), 1e-4 );

    auto top = makeLayerSolid( tree, 1, 1, 2 );
    ASSERT_TRUE( top.has_value() );
    EXPECT_TRUE( top->isClosed() );
    EXPECT_NEAR( top->volume(), 400.0 - 100.0 + 16.0, 1e-4 );
}

TEST( DSMesh, LayerSolidErrors )
{
    EXPECT_FALSE( makeLayerSolid( ContourTree{}, 0, 0, 1 ).has_value() );
    EXPECT_FALSE( makeLayerSolid( squareWithHole(), 1, 1, 1 ).has_value() );
    EXPECT_FALSE( makeLayerSolid( squareWithHole(), 0, 2, 1 ).has_value() );
}

TEST( DSMesh, TriMeshIsClosed )
{
    auto solid = makeLayerSolid( squareWithHole(), 0, 0, 1 );
    ASSERT_TRUE( solid.has_value() );
    EXPECT_TRUE( solid->isClosed() );

    TriMesh open = *solid;
    open.tris.pop_back();
    EXPECT_FALSE( open.isClosed() );

    TriMesh twice = *solid;
    twice.addMesh( *solid );
    EXPECT_TRUE( twice.isClosed() );
    EXPECT_NEAR( twice.volume(), 2 * solid->volume(), 1e-4 );
}

} //namespace DS
