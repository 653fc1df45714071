#include "DSContour.h"
#include "DSConstants.h"
#include <algorithm>
#include <cmath>

namespace DS
{

void translateContours( Contours2d& contours, const Vector2d& shift )
{
    for ( auto& c : contours )
        for ( auto& p : c )
            p += shift;
}

void scaleContours( Contours2d& contours, double scale )
{
    for ( auto& c : contours )
        for ( auto& p : c )
            p *= scale;
}

bool isPointInContour( const Contour2d& contour, const Vector2d& pt )
{
    bool inside = false;
    const auto n = contour.size();
    for ( size_t i = 0, j = n - 1; i < n; j = i++ )
    {
        const auto& a = contour[i];
        const auto& b = contour[j];
        if ( ( a.y > pt.y ) != ( b.y > pt.y ) )
        {
            const double x = a.x + ( pt.y - a.y ) * ( b.x - a.x ) / ( b.y - a.y );
            if ( pt.x < x )
                inside = !inside;
        }
    }
    return inside;
}

Contour2d makeRoundedRectContour( double width, double height, double radius, int segmentsPerCorner )
{
    const double hw = width / 2;
    const double hh = height / 2;
    radius = std::clamp( radius, 0.0, std::min( hw, hh ) );

    Contour2d res;
    if ( radius <= 0 || segmentsPerCorner <= 0 )
    {
        res = { { -hw, -hh }, { hw, -hh }, { hw, hh }, { -hw, hh } };
        return res;
    }

    // corner centers in counter-clockwise order starting from bottom-right
    const Vector2d centers[4] =
    {
        { hw - radius, -hh + radius },
        { hw - radius, hh - radius },
        { -hw + radius, hh - radius },
        { -hw + radius, -hh + radius }
    };
    res.reserve( 4 * ( segmentsPerCorner + 1 ) );
    for ( int c = 0; c < 4; ++c )
    {
        const double startAngle = -PI / 2 + c * PI / 2;
        for ( int s = 0; s <= segmentsPerCorner; ++s )
        {
            const double a = startAngle + ( PI / 2 ) * s / segmentsPerCorner;
            res.emplace_back( centers[c].x + radius * std::cos( a ), centers[c].y + radius * std::sin( a ) );
        }
    }
    // full-radius corners touch each other on the short side
    removeDegeneratePoints( res );
    return res;
}

void removeDegeneratePoints( Contour2d& contour, double eps )
{
    const double epsSq = eps * eps;
    Contour2d res;
    res.reserve( contour.size() );
    for ( const auto& p : contour )
        if ( res.empty() || distanceSq( res.back(), p ) > epsSq )
            res.push_back( p );
    while ( res.size() > 1 && distanceSq( res.front(), res.back() ) <= epsSq )
        res.pop_back();

    // remove collinear points until nothing changes
    bool changed = true;
    while ( changed && res.size() >= 3 )
    {
        changed = false;
        for ( size_t i = 0; i < res.size() && res.size() >= 3; )
        {
            const auto& prev = res[( i + res.size() - 1 ) % res.size()];
            const auto& cur = res[i];
            const auto& next = res[( i + 1 ) % res.size()];
            const auto d0 = cur - prev;
            const auto d1 = next - cur;
            const double cr = cross( d0, d1 );
            // collinear and going forward (a spike going backward is left to the caller)
            if ( std::abs( cr ) <= eps * std::max( d0.length(), d1.length() ) && dot( d0, d1 ) > 0 )
            {
                res.erase( res.begin() + i );
                changed = true;
            }
            else
                ++i;
        }
    }
    if ( res.size() < 3 )
        res.clear();
    contour = std::move( res );
}

} //namespace DS
