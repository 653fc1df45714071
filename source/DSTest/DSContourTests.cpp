#include <DSMesh/DSContour.h>
#include <DSMesh/DSConstants.h>
#include <DSMesh/DSGTest.h>
#include <algorithm>

namespace DS
{

TEST( DSMesh, calcOrientedArea )
{
    Contour2f triangle = {
        { 0, 0 },
        { 1, 0 },
        { 0, 1 }
    };
    EXPECT_NEAR( calcOrientedArea( triangle ), 0.5f, 1e-6f );

    std::reverse( triangle.begin(), triangle.end() );
    EXPECT_NEAR( calcOrientedArea( triangle ), -0.5f, 1e-6f );

    auto aread = calcOrientedArea<float, double>( triangle );
    EXPECT_NEAR( aread, -0.5, 1e-12 );

    Contour2d segment = { { 0, 0 }, { 1, 1 } };
    EXPECT_EQ( calcOrientedArea( segment ), 0.0 );
}

TEST( DSMesh, RoundedRectContour )
{
    auto rect = makeRoundedRectContour( 100, 25, 0 );
    ASSERT_EQ( rect.size(), 4u );
    EXPECT_NEAR( calcOrientedArea( rect ), 2500.0, 1e-9 );

    const double r = 2;
    auto rounded = makeRoundedRectContour( 100, 25, r, 8 );
    EXPECT_EQ( rounded.size(), 4u * 9 );
    EXPECT_GT( calcOrientedArea( rounded ), 0 );
    // corners cut by quarter circles inscribed in polygons
    const double exact = 2500.0 - ( 4 - PI ) * r * r;
    EXPECT_NEAR( calcOrientedArea( rounded ), exact, 0.1 );

    const auto box = computeBoundingBox( rounded );
    EXPECT_NEAR( box.min.x, -50, 1e-9 );
    EXPECT_NEAR( box.max.x, 50, 1e-9 );
    EXPECT_NEAR( box.min.y, -12.5, 1e-9 );
    EXPECT_NEAR( box.max.y, 12.5, 1e-9 );

    // radius is clamped by half of the smaller side
    auto pill = makeRoundedRectContour( 20, 10, 100, 8 );
    const auto pillBox = computeBoundingBox( pill );
    EXPECT_NEAR( pillBox.size().y, 10, 1e-9 );
    EXPECT_NEAR( pillBox.size().x, 20, 1e-9 );
}

TEST( DSMesh, PointInContour )
{
    const auto rect = makeRoundedRectContour( 10, 4, 0 );
    EXPECT_TRUE( isPointInContour( rect, { 0, 0 } ) );
    EXPECT_TRUE( isPointInContour( rect, { 4.9, 1.9 } ) );
    EXPECT_FALSE( isPointInContour( rect, { 5.1, 0 } ) );
    EXPECT_FALSE( isPointInContour( rect, { 0, -2.5 } ) );
}

TEST( DSMesh, RemoveDegeneratePoints )
{
    Contour2d c = {
        { 0, 0 },
        { 1, 0 },
        { 1, 0 },
        { 2, 0 },
        { 2, 2 },
        { 0, 2 },
        { 0, 0 }
    };
    removeDegeneratePoints( c );
    ASSERT_EQ( c.size(), 4u );
    EXPECT_NEAR( calcOrientedArea( c ), 4.0, 1e-12 );

    Contour2d flat = { { 0, 0 }, { 1, 0 }, { 2, 0 } };
    removeDegeneratePoints( flat );
    EXPECT_TRUE( flat.empty() );
}

TEST( DSMesh, TranslateScaleContours )
{
    Contours2d cs = { makeRoundedRectContour( 2, 2, 0 ) };
    translateContours( cs, { 10, 5 } );
    auto box = computeBoundingBox( cs );
    EXPECT_NEAR( box.center().x, 10, 1e-12 );
    EXPECT_NEAR( box.center().y, 5, 1e-12 );

    scaleContours( cs, 0.5 );
    box = computeBoundingBox( cs );
    EXPECT_NEAR( box.size().x, 1, 1e-12 );
    EXPECT_NEAR( box.center().x, 5, 1e-12 );
}

} //namespace DS
