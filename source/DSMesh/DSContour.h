#pragma once

#include "DSMeshFwd.h"
#include "DSVector2.h"
#include "DSVector3.h"
#include "DSBox.h"

namespace DS
{

/// \defgroup ContourGroup Contour
/// \ingroup MathGroup
/// \{

/// closed contours are stored without repeating the first point, the last point connects to the first one

/// >0 for counter-clockwise loop, < 0 for clockwise loop
/// \tparam R is the type for the accumulation and for result
template<typename T, typename R = T>
R calcOrientedArea( const Contour2<T> & contour )
{
    if ( contour.size() < 3 )
        return 0;

    R area = 0;
    Vector2<R> p0{ contour[0] };

    for ( int i = 2; i < contour.size(); ++i )
    {
        Vector2<R> p1{ contour[i - 1] };
        Vector2<R> p2{ contour[i] };
        area += cross( p1 - p0, p2 - p0 );
    }

    return R(0.5) * area;
}

/// returns the box of all contour points
template<typename V>
Box<V> computeBoundingBox( const Contour<V>& contour )
{
    Box<V> box;
    for ( const auto& p : contour )
        box.include( p );
    return box;
}

/// returns the box of all points of all contours
template<typename V>
Box<V> computeBoundingBox( const Contours<V>& contours )
{
    Box<V> box;
    for ( const auto& c : contours )
        box.include( computeBoundingBox( c ) );
    return box;
}

/// Copy double-contour to float-contour, or vice versa
template<typename To, typename From>
To convertContour( const From & from )
{
    To res;
    res.reserve( from.size() );
    for ( const auto & p : from )
        res.emplace_back( p );
    return res;
}

/// Copy double-contours to float-contours, or vice versa
template<typename To, typename From>
To convertContours( const From & from )
{
    To res;
    res.reserve( from.size() );
    for ( const auto & c : from )
        res.push_back( convertContour<typename To::value_type>( c ) );
    return res;
}

/// moves all points of the contours on given vector
DSMESH_API void translateContours( Contours2d& contours, const Vector2d& shift );

/// scales all points of the contours relative to the origin
DSMESH_API void scaleContours( Contours2d& contours, double scale );

/// returns true if the point is strictly inside closed contour (even-odd rule),
/// the result for points on the boundary is undefined
[[nodiscard]] DSMESH_API bool isPointInContour( const Contour2d& contour, const Vector2d& pt );

/// makes rectangle with rounded corners centered at the origin, counter-clockwise;
/// the radius is clamped to half of the smaller side, zero radius gives plain rectangle
[[nodiscard]] DSMESH_API Contour2d makeRoundedRectContour( double width, double height, double radius, int segmentsPerCorner = 8 );

/// removes repeating points (closer than eps) and points lying on the line of their neighbors,
/// also drops the last point if it repeats the first one
DSMESH_API void removeDegeneratePoints( Contour2d& contour, double eps = 1e-9 );

/// \}

} //namespace DS
